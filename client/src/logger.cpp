/*
 * 설명: 구조화 로그 레코드를 만들고 레벨에 따라 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/logger_test.cpp
 */
#include "phoenix/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace phoenix {
namespace {
std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm = *std::gmtime(&tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}
}  // namespace

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kOff:
      return "off";
  }
  return "info";
}

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "off") {
    return LogLevel::kOff;
  }
  return std::nullopt;
}

bool Logger::ShouldLog(LogLevel level) const {
  auto threshold = level_.load();
  return threshold != LogLevel::kOff && level != LogLevel::kOff && level >= threshold;
}

nlohmann::json Logger::BuildRecord(LogLevel level, const LogContext& ctx) const {
  nlohmann::json record;
  record["ts"] = ToIsoString(std::chrono::system_clock::now());
  record["seq"] = sequence_.fetch_add(1);
  record["level"] = ToString(level);
  record["eventName"] = ctx.name;
  record["message"] = ctx.message;
  if (ctx.topic) {
    record["topic"] = *ctx.topic;
  }
  if (ctx.ref) {
    record["ref"] = *ctx.ref;
  }
  if (ctx.url) {
    record["url"] = *ctx.url;
  }
  return record;
}

void Logger::Log(LogLevel level, const LogContext& ctx) const {
  if (!ShouldLog(level)) {
    return;
  }
  // 수신 프레임에 잘못된 UTF-8이 섞여 있어도 로깅이 실패하지 않게 치환한다.
  auto line = BuildRecord(level, ctx).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (level >= LogLevel::kWarn) {
    std::cerr << line << std::endl;
  } else {
    std::cout << line << std::endl;
  }
}

}  // namespace phoenix
