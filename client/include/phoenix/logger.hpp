/*
 * 설명: 한 줄 JSON 형식의 구조화 로그를 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/logger_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace phoenix {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

std::string_view ToString(LogLevel level);
std::optional<LogLevel> ParseLogLevel(std::string_view value);

struct LogContext {
  std::string name;
  std::string message;
  std::optional<std::string> topic;
  std::optional<std::string> ref;
  std::optional<std::string> url;
};

class Logger {
 public:
  explicit Logger(LogLevel level = LogLevel::kInfo) : level_(level) {}

  void SetLevel(LogLevel level) { level_.store(level); }
  LogLevel Level() const { return level_.load(); }
  bool ShouldLog(LogLevel level) const;

  // warn 이상은 std::cerr, 나머지는 std::cout으로 보낸다.
  void Log(LogLevel level, const LogContext& ctx) const;
  nlohmann::json BuildRecord(LogLevel level, const LogContext& ctx) const;

 private:
  std::atomic<LogLevel> level_;
  mutable std::atomic<std::uint64_t> sequence_{0};
};

}  // namespace phoenix
