/*
 * 설명: 와이어 배열을 직렬화하고 수신 텍스트를 Response로 복원한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/message_codec_test.cpp
 */
#include "phoenix/message_codec.hpp"

#include "phoenix/push.hpp"

namespace phoenix {
namespace {
constexpr std::size_t kWireArity = 5;

std::string StringOrEmpty(const nlohmann::json& value) {
  return value.is_string() ? value.get<std::string>() : std::string{};
}
}  // namespace

std::optional<std::string> EncodeMessage(const Push& push, std::string& error_message) {
  if (!push.GetPayload().is_object()) {
    error_message = "payload는 JSON 객체여야 합니다";
    return std::nullopt;
  }
  // 순서는 프로토콜이 고정한다.
  nlohmann::json message = nlohmann::json::array();
  message.push_back(push.JoinRef());
  message.push_back(push.GetRef().ToString());
  message.push_back(push.Topic());
  message.push_back(push.Event());
  message.push_back(push.GetPayload());
  try {
    return message.dump();
  } catch (const nlohmann::json::type_error& ex) {
    error_message = ex.what();
    return std::nullopt;
  }
}

std::optional<Response> DecodeMessage(std::string_view text, std::string& error_message) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(text);
  } catch (const nlohmann::json::exception& ex) {
    error_message = std::string{"JSON 파싱 오류: "} + ex.what();
    return std::nullopt;
  }
  if (!message.is_array() || message.size() != kWireArity) {
    error_message = "메시지는 원소 5개의 배열이어야 합니다";
    return std::nullopt;
  }
  if (!message[2].is_string() || !message[3].is_string() || !message[4].is_object()) {
    error_message = "topic/event/payload 형식이 올바르지 않습니다";
    return std::nullopt;
  }
  return Response(StringOrEmpty(message[0]), Ref(StringOrEmpty(message[1])), message[2].get<std::string>(),
                  message[3].get<std::string>(), message[4]);
}

}  // namespace phoenix
