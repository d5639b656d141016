/*
 * 설명: Push의 해석(resolve)과 콜백 1회 발화/정리 규칙을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/push_test.cpp
 */
#include "phoenix/push.hpp"

#include <utility>

namespace phoenix {

std::string_view PushErrorReason(PushError error) {
  switch (error) {
    case PushError::kInvalidPayload:
      return "Invalid payload request.";
    case PushError::kNotConnected:
      return "Not connected to socket.";
  }
  return "Unknown error.";
}

Push::Push(std::string event, std::string topic, Payload payload, Ref ref, std::string join_ref)
    : topic_(std::move(topic)), event_(std::move(event)), payload_(std::move(payload)), ref_(std::move(ref)),
      join_ref_(std::move(join_ref)) {}

Push& Push::Receive(const std::string& status, Handler callback) {
  if (result_) {
    if (result_->status && *result_->status == status) {
      callback(*this, result_->response);
    }
    return *this;
  }
  callbacks_[status].push_back(std::move(callback));
  return *this;
}

Push& Push::Always(AlwaysHandler callback) {
  if (result_) {
    callback(*this);
    return *this;
  }
  always_callbacks_.push_back(std::move(callback));
  return *this;
}

void Push::HandleResponse(const Response& response) {
  Resolve(PushResult{response.Status(), response.GetPayload(), std::nullopt});
}

void Push::HandleError(PushError error) {
  Payload reason{{"reason", PushErrorReason(error)}};
  Resolve(PushResult{std::string{"error"}, reason, error});
}

std::optional<std::string> Push::ReceivedStatus() const {
  if (!result_) {
    return std::nullopt;
  }
  return result_->status;
}

std::optional<Payload> Push::ReceivedResponse() const {
  if (!result_) {
    return std::nullopt;
  }
  return result_->response;
}

std::optional<PushError> Push::LastError() const {
  if (!result_) {
    return std::nullopt;
  }
  return result_->error;
}

void Push::Resolve(PushResult result) {
  if (result_) {
    return;
  }
  result_ = std::move(result);
  FireCallbacksAndCleanup();
}

void Push::FireCallbacksAndCleanup() {
  // 콜백 안에서 재등록해도 다시 발화되지 않도록 먼저 비운다.
  auto always = std::move(always_callbacks_);
  auto callbacks = std::move(callbacks_);
  always_callbacks_.clear();
  callbacks_.clear();

  for (auto& callback : always) {
    callback(*this);
  }
  if (!result_->status) {
    return;
  }
  auto it = callbacks.find(*result_->status);
  if (it == callbacks.end()) {
    return;
  }
  for (auto& callback : it->second) {
    callback(*this, result_->response);
  }
}

}  // namespace phoenix
