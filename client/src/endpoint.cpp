/*
 * 설명: 엔드포인트 URL을 분해하고 쿼리 문자열을 인코딩/디코딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/endpoint_test.cpp
 */
#include "phoenix/endpoint.hpp"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace phoenix {
namespace {
std::string PercentEncode(const std::string& value) {
  std::ostringstream oss;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      oss << c;
    } else {
      oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
          << std::nouppercase << std::dec;
    }
  }
  return oss.str();
}
}  // namespace

std::optional<Endpoint> ParseEndpoint(const std::string& url, std::string& error_message) {
  const std::string ws = "ws://";
  const std::string wss = "wss://";
  Endpoint out;
  std::size_t pos = 0;
  if (url.compare(0, ws.size(), ws) == 0) {
    pos = ws.size();
  } else if (url.compare(0, wss.size(), wss) == 0) {
    out.secure = true;
    pos = wss.size();
  } else {
    error_message = "ws:// 또는 wss:// 스킴이 필요합니다";
    return std::nullopt;
  }

  auto slash = url.find_first_of("/?", pos);
  std::string hostport = slash == std::string::npos ? url.substr(pos) : url.substr(pos, slash - pos);
  if (hostport.empty()) {
    error_message = "호스트가 비어 있습니다";
    return std::nullopt;
  }
  auto colon = hostport.rfind(':');
  if (colon != std::string::npos) {
    out.host = hostport.substr(0, colon);
    out.port = hostport.substr(colon + 1);
  } else {
    out.host = hostport;
    out.port = out.secure ? "443" : "80";
  }
  if (out.host.empty() || out.port.empty()) {
    error_message = "호스트 또는 포트가 비어 있습니다";
    return std::nullopt;
  }
  for (char c : out.port) {
    if (c < '0' || c > '9') {
      error_message = "포트는 숫자여야 합니다";
      return std::nullopt;
    }
  }
  auto port = std::strtoul(out.port.c_str(), nullptr, 10);
  if (port == 0 || port > 65535) {
    error_message = "포트 범위가 올바르지 않습니다";
    return std::nullopt;
  }

  if (slash == std::string::npos) {
    out.target = "/";
  } else if (url[slash] == '?') {
    out.target = "/" + url.substr(slash);
  } else {
    out.target = url.substr(slash);
  }
  return out;
}

std::string AppendQueryParams(const std::string& url, const std::map<std::string, std::string>& params) {
  if (params.empty()) {
    return url;
  }
  std::ostringstream oss;
  oss << url;
  char separator = url.find('?') == std::string::npos ? '?' : '&';
  for (const auto& [key, value] : params) {
    oss << separator << PercentEncode(key) << '=' << PercentEncode(value);
    separator = '&';
  }
  return oss.str();
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::string BuildDefaultUrl(const std::string& host, unsigned short port, const std::string& path,
                            const std::string& transport) {
  std::ostringstream oss;
  oss << "ws://" << host << ':' << port << '/' << path << '/' << transport;
  return oss.str();
}

}  // namespace phoenix
