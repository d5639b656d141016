/*
 * 설명: 수신 프레임 값 객체를 구성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/message_codec_test.cpp
 */
#include "phoenix/response.hpp"

#include <utility>

namespace phoenix {

Response::Response(std::string join_ref, Ref ref, std::string topic, std::string event, Payload payload)
    : join_ref_(std::move(join_ref)), ref_(std::move(ref)), topic_(std::move(topic)), event_(std::move(event)),
      payload_(std::move(payload)) {}

std::optional<std::string> Response::Status() const {
  auto it = payload_.find("status");
  if (it == payload_.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

}  // namespace phoenix
