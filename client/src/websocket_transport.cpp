/*
 * 설명: WebSocket 연결 수립, 읽기 루프, 직렬화된 송신 큐와 백프레셔 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/e2e/websocket_transport_test.cpp
 */
#include "phoenix/websocket_transport.hpp"

#include <chrono>
#include <iterator>
#include <stdexcept>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "phoenix/socket.hpp"

namespace phoenix {
namespace {
constexpr std::chrono::seconds kConnectTimeout{30};
}  // namespace

WebSocketTransport::WebSocketTransport(boost::asio::io_context& ioc, Endpoint endpoint,
                                       std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ioc_(ioc), resolver_(ioc), endpoint_(std::move(endpoint)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

void WebSocketTransport::Connect() {
  if (conn_ && !conn_->notified) {
    // 진행 중인 시도나 연결은 알림 없이 버린다.
    conn_->notified = true;
    boost::beast::get_lowest_layer(conn_->ws).close();
  }
  resolver_.cancel();

  auto conn = std::make_shared<Connection>(ioc_);
  conn_ = conn;
  auto self = shared_from_this();
  resolver_.async_resolve(
      endpoint_.host, endpoint_.port,
      [self, conn](boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results) {
        self->OnResolve(conn, ec, std::move(results));
      });
}

void WebSocketTransport::Disconnect() {
  if (!conn_ || conn_->notified) {
    return;
  }
  auto conn = conn_;
  conn->user_closing = true;
  if (!conn->open) {
    resolver_.cancel();
    boost::beast::get_lowest_layer(conn->ws).close();
    NotifyClosed(conn, {});
    return;
  }
  if (conn->closing) {
    return;
  }
  conn->closing = true;
  auto self = shared_from_this();
  conn->ws.async_close(boost::beast::websocket::close_code::normal, [self, conn](boost::beast::error_code ec) {
    if (ec) {
      self->NotifyClosed(conn, {});
    }
  });
}

bool WebSocketTransport::IsConnected() const {
  return conn_ && conn_->open && !conn_->closing && !conn_->notified;
}

void WebSocketTransport::Write(std::string message) {
  if (!IsConnected()) {
    return;
  }
  auto conn = conn_;
  const auto message_size = message.size();
  if (conn->send_queue.size() >= max_queue_messages_ || conn->queued_bytes + message_size > max_queue_bytes_) {
    TriggerBackpressureClose(conn);
    return;
  }
  conn->send_queue.push_back(std::move(message));
  conn->queued_bytes += message_size;
  if (!conn->writing) {
    WriteNext(conn);
  }
}

std::string WebSocketTransport::Url() const {
  return (endpoint_.secure ? "wss://" : "ws://") + endpoint_.host + ":" + endpoint_.port + endpoint_.target;
}

std::size_t WebSocketTransport::QueuedMessages() const { return conn_ ? conn_->send_queue.size() : 0; }

void WebSocketTransport::OnResolve(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec,
                                   boost::asio::ip::tcp::resolver::results_type results) {
  if (!IsCurrent(conn) || conn->notified) {
    return;
  }
  if (ec) {
    return NotifyClosed(conn, ec);
  }
  auto& layer = boost::beast::get_lowest_layer(conn->ws);
  layer.expires_after(kConnectTimeout);
  auto self = shared_from_this();
  layer.async_connect(results, [self, conn](boost::beast::error_code connect_ec, boost::asio::ip::tcp::endpoint) {
    self->OnConnect(conn, connect_ec);
  });
}

void WebSocketTransport::OnConnect(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec) {
  if (!IsCurrent(conn) || conn->notified) {
    return;
  }
  if (ec) {
    return NotifyClosed(conn, ec);
  }
  // 핸드셰이크 이후에는 WebSocket 자체 타임아웃 정책을 쓴다.
  boost::beast::get_lowest_layer(conn->ws).expires_never();
  conn->ws.set_option(
      boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::client));
  auto self = shared_from_this();
  conn->ws.async_handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target,
                           [self, conn](boost::beast::error_code handshake_ec) {
                             self->OnHandshake(conn, handshake_ec);
                           });
}

void WebSocketTransport::OnHandshake(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec) {
  if (!IsCurrent(conn) || conn->notified) {
    return;
  }
  if (ec) {
    return NotifyClosed(conn, ec);
  }
  conn->open = true;
  DoRead(conn);
  if (handlers_.on_open) {
    handlers_.on_open();
  }
}

void WebSocketTransport::DoRead(const std::shared_ptr<Connection>& conn) {
  if (!IsCurrent(conn) || conn->notified) {
    return;
  }
  auto self = shared_from_this();
  conn->ws.async_read(conn->buffer, [self, conn](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    self->OnRead(conn, ec);
  });
}

void WebSocketTransport::OnRead(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec) {
  if (!IsCurrent(conn) || conn->notified) {
    return;
  }
  if (ec) {
    return NotifyClosed(conn, conn->user_closing ? boost::beast::error_code{} : ec);
  }
  auto text = boost::beast::buffers_to_string(conn->buffer.data());
  conn->buffer.consume(conn->buffer.size());
  if (handlers_.on_text) {
    handlers_.on_text(text);
  }
  DoRead(conn);
}

void WebSocketTransport::WriteNext(const std::shared_ptr<Connection>& conn) {
  if (conn->send_queue.empty() || conn->closing || conn->notified) {
    return;
  }
  conn->writing = true;
  auto self = shared_from_this();
  conn->ws.text(true);
  conn->ws.async_write(boost::asio::buffer(conn->send_queue.front()),
                       [self, conn](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                         self->OnWrite(conn, ec);
                       });
}

void WebSocketTransport::OnWrite(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec) {
  conn->writing = false;
  if (!conn->send_queue.empty()) {
    conn->queued_bytes -= conn->send_queue.front().size();
    conn->send_queue.pop_front();
  }
  if (ec) {
    if (IsCurrent(conn) && !conn->user_closing) {
      NotifyClosed(conn, ec);
    }
    return;
  }
  if (!conn->send_queue.empty()) {
    WriteNext(conn);
  }
}

void WebSocketTransport::TriggerBackpressureClose(const std::shared_ptr<Connection>& conn) {
  if (conn->closing) {
    return;
  }
  conn->closing = true;
  // 전송 중인 맨 앞 버퍼는 async_write가 참조하므로 남겨 둔다.
  if (conn->writing && !conn->send_queue.empty()) {
    conn->send_queue.erase(std::next(conn->send_queue.begin()), conn->send_queue.end());
    conn->queued_bytes = conn->send_queue.front().size();
  } else {
    conn->send_queue.clear();
    conn->queued_bytes = 0;
  }
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  conn->ws.async_close(reason, [self, conn](boost::beast::error_code ec) {
    if (ec) {
      self->NotifyClosed(conn, ec);
    }
  });
}

void WebSocketTransport::NotifyClosed(const std::shared_ptr<Connection>& conn, boost::beast::error_code ec) {
  if (conn->notified) {
    return;
  }
  conn->notified = true;
  conn->open = false;
  boost::beast::get_lowest_layer(conn->ws).close();
  if (IsCurrent(conn) && handlers_.on_close) {
    handlers_.on_close(ec);
  }
}

std::shared_ptr<Socket> CreateWebSocketSocket(boost::asio::io_context& ioc, const std::string& url,
                                              const std::map<std::string, std::string>& params,
                                              SocketOptions options, std::shared_ptr<Logger> logger,
                                              std::size_t max_queue_messages, std::size_t max_queue_bytes) {
  std::string error_message;
  auto endpoint = ParseEndpoint(AppendQueryParams(url, params), error_message);
  if (!endpoint) {
    throw std::invalid_argument(error_message + ": " + url);
  }
  if (endpoint->secure) {
    throw std::invalid_argument("wss:// 엔드포인트는 지원하지 않습니다: " + url);
  }
  auto transport = std::make_shared<WebSocketTransport>(ioc, *endpoint, max_queue_messages, max_queue_bytes);
  return std::make_shared<Socket>(ioc, std::move(transport), options, std::move(logger));
}

}  // namespace phoenix
