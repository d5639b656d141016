/*
 * 설명: 전송 계층, 대기 중 push 상관관계 테이블, 채널 레지스트리, 하트비트/재연결 루프를 총괄한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/socket_test.cpp, client/tests/unit/channel_test.cpp,
 *         client/tests/e2e/websocket_transport_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "phoenix/channel.hpp"
#include "phoenix/config.hpp"
#include "phoenix/logger.hpp"
#include "phoenix/push.hpp"
#include "phoenix/response.hpp"
#include "phoenix/transport.hpp"

namespace phoenix {

enum class ConnectionState {
  kInitial,
  kConnecting,
  kConnected,
  kDisconnecting,
  kDisconnected,
};

std::string_view ToString(ConnectionState state);

// 모든 공개 메서드와 전송 계층 콜백은 io_context를 돌리는 단일 스레드에서 호출되어야 한다.
class Socket : public std::enable_shared_from_this<Socket> {
 public:
  using ConnectHandler = std::function<void()>;
  using DisconnectHandler = std::function<void(const boost::system::error_code& ec)>;
  using ResponseHandler = std::function<void(const Response&)>;
  using StateChangeHandler = std::function<void(ConnectionState old_state, ConnectionState new_state)>;

  Socket(boost::asio::io_context& ioc, std::shared_ptr<Transport> transport, SocketOptions options = {},
         std::shared_ptr<Logger> logger = nullptr);
  ~Socket();

  void Connect();
  void Disconnect();

  std::shared_ptr<Channel> CreateChannel(const std::string& topic, Payload params = Payload::object());
  void Remove(const std::shared_ptr<Channel>& channel);
  void Register(const std::shared_ptr<Channel>& channel);
  void Unregister(const std::string& topic, const Channel* channel);

  std::shared_ptr<Push> Send(const std::string& event, const std::string& topic, const Payload& payload);
  std::shared_ptr<Push> Send(const std::shared_ptr<Push>& push);

  // 디코딩에 실패한 프레임은 로그만 남기고 버린다.
  std::optional<Response> HandleMessage(const std::string& text);

  void SetOnConnect(ConnectHandler handler) { on_connect_ = std::move(handler); }
  void SetOnDisconnect(DisconnectHandler handler) { on_disconnect_ = std::move(handler); }
  void SetOnResponse(ResponseHandler handler) { on_response_ = std::move(handler); }
  void SetOnStateChange(StateChangeHandler handler) { on_state_change_ = std::move(handler); }

  bool IsConnected() const { return transport_->IsConnected(); }
  ConnectionState State() const { return state_; }
  const SocketOptions& Options() const { return options_; }
  const std::unordered_map<std::string, std::shared_ptr<Channel>>& Channels() const { return channels_; }
  std::size_t PendingCount() const { return pending_.size(); }
  bool IsReconnectScheduled() const { return reconnect_scheduled_; }

 private:
  void InstallTransportHandlers();
  void OnTransportOpen();
  void OnTransportClose(const boost::system::error_code& ec);
  void SetState(ConnectionState state);
  void ScheduleHeartbeat();
  void SendHeartbeat();
  void ScheduleReconnect();
  void CancelReconnect();
  void ResetPendingState();
  void Log(LogLevel level, LogContext ctx) const;

  std::shared_ptr<Transport> transport_;
  SocketOptions options_;
  std::shared_ptr<Logger> logger_;
  boost::asio::steady_timer heartbeat_timer_;
  boost::asio::steady_timer reconnect_timer_;
  ConnectionState state_{ConnectionState::kInitial};
  bool expected_disconnect_{false};
  bool reconnect_scheduled_{false};
  std::unordered_map<std::string, std::shared_ptr<Push>> pending_;
  std::unordered_map<std::string, std::shared_ptr<Channel>> channels_;
  ConnectHandler on_connect_;
  DisconnectHandler on_disconnect_;
  ResponseHandler on_response_;
  StateChangeHandler on_state_change_;
};

}  // namespace phoenix
