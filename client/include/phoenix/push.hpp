/*
 * 설명: 응답을 최대 한 번 기다리는 단일 요청(Push)과 상태별 콜백 레지스트리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/push_test.cpp, client/tests/unit/socket_test.cpp
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "phoenix/ref.hpp"
#include "phoenix/response.hpp"

namespace phoenix {

enum class PushError {
  kInvalidPayload,
  kNotConnected,
};

// 합성 "error" 응답의 reason 필드로 전달되는 문구.
std::string_view PushErrorReason(PushError error);

struct PushResult {
  std::optional<std::string> status;
  Payload response;
  std::optional<PushError> error;
};

class Push {
 public:
  using Handler = std::function<void(Push&, const Payload&)>;
  using AlwaysHandler = std::function<void(Push&)>;

  Push(std::string event, std::string topic, Payload payload, Ref ref = Ref::Generate(),
       std::string join_ref = {});

  Push(const Push&) = delete;
  Push& operator=(const Push&) = delete;

  Push& Receive(const std::string& status, Handler callback);
  Push& Always(AlwaysHandler callback);

  void HandleResponse(const Response& response);
  void HandleError(PushError error);

  const std::string& Topic() const { return topic_; }
  const std::string& Event() const { return event_; }
  const Payload& GetPayload() const { return payload_; }
  const Ref& GetRef() const { return ref_; }
  const std::string& JoinRef() const { return join_ref_; }

  bool IsResolved() const { return result_.has_value(); }
  const std::optional<PushResult>& Result() const { return result_; }
  std::optional<std::string> ReceivedStatus() const;
  std::optional<Payload> ReceivedResponse() const;
  std::optional<PushError> LastError() const;

 private:
  void Resolve(PushResult result);
  void FireCallbacksAndCleanup();

  std::string topic_;
  std::string event_;
  Payload payload_;
  Ref ref_;
  std::string join_ref_;
  std::optional<PushResult> result_;
  std::unordered_map<std::string, std::vector<Handler>> callbacks_;
  std::vector<AlwaysHandler> always_callbacks_;
};

}  // namespace phoenix
