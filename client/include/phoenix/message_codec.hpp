/*
 * 설명: [joinRef, ref, topic, event, payload] 5-튜플 와이어 포맷의 인코딩/디코딩을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/message_codec_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "phoenix/response.hpp"

namespace phoenix {

class Push;

namespace event {
constexpr std::string_view kHeartbeat = "heartbeat";
constexpr std::string_view kJoin = "phx_join";
constexpr std::string_view kLeave = "phx_leave";
constexpr std::string_view kReply = "phx_reply";
constexpr std::string_view kError = "phx_error";
constexpr std::string_view kClose = "phx_close";
constexpr std::string_view kPresenceState = "presence_state";
constexpr std::string_view kPresenceDiff = "presence_diff";
}  // namespace event

constexpr std::string_view kHeartbeatTopic = "phoenix";

// 실패 시 nullopt와 함께 error_message를 채운다. 예외를 던지지 않는다.
std::optional<std::string> EncodeMessage(const Push& push, std::string& error_message);
std::optional<Response> DecodeMessage(std::string_view text, std::string& error_message);

}  // namespace phoenix
