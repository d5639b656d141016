/*
 * 설명: 클라이언트 환경설정 로딩과 소켓 옵션 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>

namespace phoenix {

struct SocketOptions {
  std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
  std::chrono::milliseconds reconnect_interval{std::chrono::seconds(5)};
  bool auto_reconnect{true};
  bool enable_logging{true};
};

struct ClientConfig {
  std::string url;
  std::string topic;
  std::map<std::string, std::string> params;
  std::string log_level;
  std::size_t heartbeat_interval_seconds;
  std::size_t reconnect_interval_seconds;
  bool auto_reconnect;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
};

ClientConfig LoadConfigFromEnv();
SocketOptions ToSocketOptions(const ClientConfig& config);

}  // namespace phoenix
