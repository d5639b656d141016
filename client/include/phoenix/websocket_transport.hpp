/*
 * 설명: Boost.Beast WebSocket 기반 전송 계층으로 연결, 송신 큐, 백프레셔, 수신 루프를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/e2e/websocket_transport_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "phoenix/config.hpp"
#include "phoenix/endpoint.hpp"
#include "phoenix/logger.hpp"
#include "phoenix/transport.hpp"

namespace phoenix {

class Socket;

class WebSocketTransport : public Transport, public std::enable_shared_from_this<WebSocketTransport> {
 public:
  WebSocketTransport(boost::asio::io_context& ioc, Endpoint endpoint, std::size_t max_queue_messages = 1024,
                     std::size_t max_queue_bytes = 4 * 1024 * 1024);

  void SetHandlers(TransportHandlers handlers) override { handlers_ = std::move(handlers); }
  void Connect() override;
  void Disconnect() override;
  bool IsConnected() const override;
  void Write(std::string message) override;
  std::string Url() const override;

  std::size_t QueuedMessages() const;

 private:
  // 연결 시도마다 새로 만든다. 이전 시도의 완료 핸들러는 conn_과 비교해 버린다.
  struct Connection {
    explicit Connection(boost::asio::io_context& ioc) : ws(ioc) {}

    boost::beast::websocket::stream<boost::beast::tcp_stream> ws;
    boost::beast::flat_buffer buffer;
    std::deque<std::string> send_queue;
    std::size_t queued_bytes{0};
    bool open{false};
    bool writing{false};
    bool closing{false};
    bool user_closing{false};
    bool notified{false};
  };

  void OnResolve(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec,
                 boost::asio::ip::tcp::resolver::results_type results);
  void OnConnect(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec);
  void OnHandshake(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec);
  void DoRead(const std::shared_ptr<Connection>& conn);
  void OnRead(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec);
  void WriteNext(const std::shared_ptr<Connection>& conn);
  void OnWrite(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec);
  void TriggerBackpressureClose(const std::shared_ptr<Connection>& conn);
  void NotifyClosed(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec);
  bool IsCurrent(const std::shared_ptr<Connection>& conn) const { return conn && conn == conn_; }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::resolver resolver_;
  Endpoint endpoint_;
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
  TransportHandlers handlers_;
  std::shared_ptr<Connection> conn_;
};

// url에 params를 붙여 WebSocketTransport와 Socket을 함께 만든다. 잘못된 URL이면 std::invalid_argument.
std::shared_ptr<Socket> CreateWebSocketSocket(boost::asio::io_context& ioc, const std::string& url,
                                              const std::map<std::string, std::string>& params = {},
                                              SocketOptions options = {}, std::shared_ptr<Logger> logger = nullptr,
                                              std::size_t max_queue_messages = 1024,
                                              std::size_t max_queue_bytes = 4 * 1024 * 1024);

}  // namespace phoenix
