/*
 * 설명: WebSocket 엔드포인트 URL 파싱과 쿼리 파라미터 조립을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/endpoint_test.cpp
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace phoenix {

struct Endpoint {
  bool secure{false};
  std::string host;
  std::string port;
  std::string target;
};

// ws://host[:port]/path[?query] 형식만 허용한다. wss는 secure=true로 표시만 한다.
std::optional<Endpoint> ParseEndpoint(const std::string& url, std::string& error_message);

std::string AppendQueryParams(const std::string& url, const std::map<std::string, std::string>& params);
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);
std::string BuildDefaultUrl(const std::string& host = "localhost", unsigned short port = 4000,
                            const std::string& path = "socket", const std::string& transport = "websocket");

}  // namespace phoenix
