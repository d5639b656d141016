/*
 * 설명: 디코딩된 수신 프레임(Response)과 페이로드 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/message_codec_test.cpp
 */
#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "phoenix/ref.hpp"

namespace phoenix {

using Payload = nlohmann::json;

class Response {
 public:
  Response(std::string join_ref, Ref ref, std::string topic, std::string event, Payload payload);

  const std::string& JoinRef() const { return join_ref_; }
  const Ref& GetRef() const { return ref_; }
  const std::string& Topic() const { return topic_; }
  const std::string& Event() const { return event_; }
  const Payload& GetPayload() const { return payload_; }

  // phx_reply 페이로드의 status 문자열. 없거나 문자열이 아니면 nullopt.
  std::optional<std::string> Status() const;

 private:
  std::string join_ref_;
  Ref ref_;
  std::string topic_;
  std::string event_;
  Payload payload_;
};

}  // namespace phoenix
