/*
 * 설명: 소켓 코어가 의존하는 전송 계층 협력자 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/socket_test.cpp, client/tests/e2e/websocket_transport_test.cpp
 */
#pragma once

#include <functional>
#include <string>

#include <boost/system/error_code.hpp>

namespace phoenix {

struct TransportHandlers {
  std::function<void()> on_open;
  // 호출자가 요청한 종료이면 ec는 비어 있다.
  std::function<void(const boost::system::error_code& ec)> on_close;
  std::function<void(const std::string& text)> on_text;
};

class Transport {
 public:
  virtual ~Transport() = default;

  virtual void SetHandlers(TransportHandlers handlers) = 0;
  virtual void Connect() = 0;
  virtual void Disconnect() = 0;
  virtual bool IsConnected() const = 0;
  virtual void Write(std::string message) = 0;
  virtual std::string Url() const = 0;
};

}  // namespace phoenix
