/*
 * 설명: 환경변수에서 클라이언트 설정을 읽고 소켓 옵션으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/config_test.cpp
 */
#include "phoenix/config.hpp"

#include <cstdlib>

#include "phoenix/endpoint.hpp"

namespace phoenix {

ClientConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  ClientConfig cfg;
  cfg.url = get_env("PHX_URL", BuildDefaultUrl().c_str());
  cfg.topic = get_env("PHX_TOPIC", "room:lobby");
  for (const auto& [key, value] : ParseQueryParams(get_env("PHX_PARAMS", ""))) {
    cfg.params.emplace(key, value);
  }
  cfg.log_level = get_env("PHX_LOG_LEVEL", "info");
  cfg.heartbeat_interval_seconds = static_cast<std::size_t>(std::stoul(get_env("PHX_HEARTBEAT_SECONDS", "30")));
  cfg.reconnect_interval_seconds = static_cast<std::size_t>(std::stoul(get_env("PHX_RECONNECT_SECONDS", "5")));
  auto auto_reconnect = get_env("PHX_AUTO_RECONNECT", "true");
  cfg.auto_reconnect = auto_reconnect == "true" || auto_reconnect == "1";
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("PHX_WS_QUEUE_LIMIT_MESSAGES", "1024")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("PHX_WS_QUEUE_LIMIT_BYTES", "4194304")));
  return cfg;
}

SocketOptions ToSocketOptions(const ClientConfig& config) {
  SocketOptions options;
  options.heartbeat_interval = std::chrono::seconds(config.heartbeat_interval_seconds);
  options.reconnect_interval = std::chrono::seconds(config.reconnect_interval_seconds);
  options.auto_reconnect = config.auto_reconnect;
  options.enable_logging = config.log_level != "off";
  return options;
}

}  // namespace phoenix
