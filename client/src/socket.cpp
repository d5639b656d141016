/*
 * 설명: 송신/수신 상관관계, 채널 라우팅, 하트비트와 재연결 타이머를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/socket_test.cpp, client/tests/unit/channel_test.cpp,
 *         client/tests/e2e/websocket_transport_test.cpp
 */
#include "phoenix/socket.hpp"

#include <utility>

#include "phoenix/message_codec.hpp"

namespace phoenix {

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kInitial:
      return "initial";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
    case ConnectionState::kDisconnecting:
      return "disconnecting";
    case ConnectionState::kDisconnected:
      return "disconnected";
  }
  return "initial";
}

Socket::Socket(boost::asio::io_context& ioc, std::shared_ptr<Transport> transport, SocketOptions options,
               std::shared_ptr<Logger> logger)
    : transport_(std::move(transport)), options_(options),
      logger_(logger ? std::move(logger) : std::make_shared<Logger>()), heartbeat_timer_(ioc),
      reconnect_timer_(ioc) {}

Socket::~Socket() {
  transport_->SetHandlers({});
  heartbeat_timer_.cancel();
  reconnect_timer_.cancel();
}

void Socket::Connect() {
  if (transport_->IsConnected()) {
    return;
  }
  InstallTransportHandlers();
  Log(LogLevel::kInfo, {"socket.connect", "연결을 시도합니다", std::nullopt, std::nullopt, transport_->Url()});
  SetState(ConnectionState::kConnecting);
  transport_->Connect();
}

void Socket::Disconnect() {
  // 호출자가 요청한 종료는 재연결하지 않는다.
  expected_disconnect_ = true;
  CancelReconnect();
  if (!transport_->IsConnected() && state_ != ConnectionState::kConnecting) {
    return;
  }
  Log(LogLevel::kInfo, {"socket.disconnect", "연결을 종료합니다", std::nullopt, std::nullopt, transport_->Url()});
  SetState(ConnectionState::kDisconnecting);
  transport_->Disconnect();
}

std::shared_ptr<Channel> Socket::CreateChannel(const std::string& topic, Payload params) {
  auto channel = std::make_shared<Channel>(weak_from_this(), topic, std::move(params));
  channels_[topic] = channel;
  return channel;
}

void Socket::Remove(const std::shared_ptr<Channel>& channel) {
  if (!channel) {
    return;
  }
  channel->Leave();
}

void Socket::Register(const std::shared_ptr<Channel>& channel) {
  if (!channel) {
    return;
  }
  // 같은 토픽을 다른 채널이 이미 쓰고 있으면 교체하지 않는다.
  channels_.emplace(channel->Topic(), channel);
}

void Socket::Unregister(const std::string& topic, const Channel* channel) {
  auto it = channels_.find(topic);
  if (it == channels_.end()) {
    return;
  }
  if (it->second.get() == channel) {
    channels_.erase(it);
  }
}

std::shared_ptr<Push> Socket::Send(const std::string& event, const std::string& topic, const Payload& payload) {
  return Send(std::make_shared<Push>(event, topic, payload));
}

std::shared_ptr<Push> Socket::Send(const std::shared_ptr<Push>& push) {
  if (!transport_->IsConnected()) {
    push->HandleError(PushError::kNotConnected);
    return push;
  }

  std::string error_message;
  auto data = EncodeMessage(*push, error_message);
  if (!data) {
    Log(LogLevel::kError, {"push.encode_failed", error_message, push->Topic(), push->GetRef().ToString(), std::nullopt});
    push->HandleError(PushError::kInvalidPayload);
    return push;
  }

  Log(LogLevel::kDebug, {"push.send", push->Event(), push->Topic(), push->GetRef().ToString(), std::nullopt});
  pending_[push->GetRef().ToString()] = push;
  transport_->Write(std::move(*data));
  return push;
}

std::optional<Response> Socket::HandleMessage(const std::string& text) {
  std::string error_message;
  auto response = DecodeMessage(text, error_message);
  if (!response) {
    Log(LogLevel::kWarn, {"message.decode_failed", error_message + ": " + text, std::nullopt, std::nullopt,
                          std::nullopt});
    return std::nullopt;
  }
  Log(LogLevel::kDebug,
      {"message.received", response->Event(), response->Topic(), response->GetRef().ToString(), std::nullopt});

  // 응답 여부와 관계없이 항목을 제거해 같은 push에 두 번 전달되지 않게 한다.
  std::shared_ptr<Push> push;
  auto it = pending_.find(response->GetRef().ToString());
  if (it != pending_.end()) {
    push = it->second;
    pending_.erase(it);
  }
  if (push) {
    push->HandleResponse(*response);
  }

  auto channel_it = channels_.find(response->Topic());
  if (channel_it != channels_.end()) {
    auto channel = channel_it->second;
    channel->Received(*response);
  }
  if (on_response_) {
    on_response_(*response);
  }
  return response;
}

void Socket::InstallTransportHandlers() {
  std::weak_ptr<Socket> weak_self = weak_from_this();
  TransportHandlers handlers;
  handlers.on_open = [weak_self]() {
    if (auto self = weak_self.lock()) {
      self->OnTransportOpen();
    }
  };
  handlers.on_close = [weak_self](const boost::system::error_code& ec) {
    if (auto self = weak_self.lock()) {
      self->OnTransportClose(ec);
    }
  };
  handlers.on_text = [weak_self](const std::string& text) {
    if (auto self = weak_self.lock()) {
      self->HandleMessage(text);
    }
  };
  transport_->SetHandlers(std::move(handlers));
}

void Socket::OnTransportOpen() {
  expected_disconnect_ = false;
  CancelReconnect();
  Log(LogLevel::kInfo, {"socket.connected", "연결되었습니다", std::nullopt, std::nullopt, transport_->Url()});
  SetState(ConnectionState::kConnected);
  if (on_connect_) {
    on_connect_();
  }
  ScheduleHeartbeat();
}

void Socket::OnTransportClose(const boost::system::error_code& ec) {
  heartbeat_timer_.cancel();
  Log(ec ? LogLevel::kWarn : LogLevel::kInfo,
      {"socket.disconnected", ec ? ec.message() : std::string{"연결이 종료되었습니다"}, std::nullopt, std::nullopt,
       transport_->Url()});
  SetState(ConnectionState::kDisconnected);
  if (on_disconnect_) {
    on_disconnect_(ec);
  }
  ResetPendingState();
  if (!expected_disconnect_ && options_.auto_reconnect && options_.reconnect_interval.count() > 0) {
    ScheduleReconnect();
  }
}

void Socket::SetState(ConnectionState state) {
  if (state_ == state) {
    return;
  }
  auto old_state = state_;
  state_ = state;
  if (on_state_change_) {
    on_state_change_(old_state, state_);
  }
}

void Socket::ScheduleHeartbeat() {
  if (options_.heartbeat_interval.count() <= 0) {
    return;
  }
  heartbeat_timer_.expires_after(options_.heartbeat_interval);
  std::weak_ptr<Socket> weak_self = weak_from_this();
  heartbeat_timer_.async_wait([weak_self](const boost::system::error_code& ec) {
    auto self = weak_self.lock();
    if (!self || ec) {
      return;
    }
    self->SendHeartbeat();
  });
}

void Socket::SendHeartbeat() {
  // 연결이 끊긴 뒤 늦게 발화한 타이머는 아무것도 하지 않고 재예약도 하지 않는다.
  if (!transport_->IsConnected()) {
    return;
  }
  auto push = std::make_shared<Push>(std::string{event::kHeartbeat}, std::string{kHeartbeatTopic},
                                     Payload::object(), Ref::Generate(std::string{kHeartbeatRefPrefix}));
  Send(push);
  ScheduleHeartbeat();
}

void Socket::ScheduleReconnect() {
  if (reconnect_scheduled_) {
    return;
  }
  reconnect_scheduled_ = true;
  reconnect_timer_.expires_after(options_.reconnect_interval);
  std::weak_ptr<Socket> weak_self = weak_from_this();
  reconnect_timer_.async_wait([weak_self](const boost::system::error_code& ec) {
    auto self = weak_self.lock();
    if (!self || ec) {
      return;
    }
    self->reconnect_scheduled_ = false;
    // 진행 중인 시도는 끊지 않는다. 실패하면 OnTransportClose가 다시 예약한다.
    if (self->expected_disconnect_ || self->transport_->IsConnected() ||
        self->state_ == ConnectionState::kConnecting) {
      return;
    }
    self->Log(LogLevel::kInfo,
              {"socket.reconnect", "재연결을 시도합니다", std::nullopt, std::nullopt, self->transport_->Url()});
    self->Connect();
  });
}

void Socket::CancelReconnect() {
  if (!reconnect_scheduled_) {
    return;
  }
  reconnect_scheduled_ = false;
  reconnect_timer_.cancel();
}

void Socket::ResetPendingState() {
  auto pending = std::move(pending_);
  pending_.clear();
  for (auto& [ref, push] : pending) {
    push->HandleError(PushError::kNotConnected);
  }
  auto channels = std::move(channels_);
  channels_.clear();
  for (auto& [topic, channel] : channels) {
    channel->HandleConnectionLost();
  }
}

void Socket::Log(LogLevel level, LogContext ctx) const {
  if (!options_.enable_logging || !logger_) {
    return;
  }
  logger_->Log(level, ctx);
}

}  // namespace phoenix
