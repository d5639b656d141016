/*
 * 설명: 채널 join/leave 흐름, 이벤트 디스패치, 내장 presence 핸들러를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/channel_test.cpp
 */
#include "phoenix/channel.hpp"

#include <utility>

#include "phoenix/message_codec.hpp"
#include "phoenix/socket.hpp"

namespace phoenix {

std::string_view ToString(ChannelState state) {
  switch (state) {
    case ChannelState::kClosed:
      return "closed";
    case ChannelState::kErrored:
      return "errored";
    case ChannelState::kJoined:
      return "joined";
    case ChannelState::kJoining:
      return "joining";
    case ChannelState::kLeaving:
      return "leaving";
  }
  return "closed";
}

Channel::Channel(std::weak_ptr<Socket> socket, std::string topic, Payload params)
    : socket_(std::move(socket)), topic_(std::move(topic)),
      params_(params.is_null() ? Payload::object() : std::move(params)) {
  InstallPresenceHandlers();
}

void Channel::InstallPresenceHandlers() {
  On(std::string{event::kPresenceState}, [](Channel& channel, const Response& response) {
    channel.presence_.Sync(response);
    if (channel.presence_update_handler_) {
      channel.presence_update_handler_(channel, channel.presence_);
    }
  });
  On(std::string{event::kPresenceDiff},
     [](Channel& channel, const Response& response) { channel.presence_.Sync(response); });
}

std::shared_ptr<Push> Channel::Join() {
  // 연결 종료나 leave로 레지스트리에서 빠진 채널도 다시 라우팅되도록 재등록한다.
  if (auto socket = socket_.lock()) {
    socket->Register(shared_from_this());
  }
  state_ = ChannelState::kJoining;
  auto ref = Ref::Generate();
  join_ref_ = ref.ToString();
  auto push = std::make_shared<Push>(std::string{event::kJoin}, topic_, params_, ref, join_ref_);
  std::weak_ptr<Channel> weak_self = weak_from_this();
  Dispatch(push);
  // 재join 이후 도착한 이전 join의 응답은 상태를 바꾸지 않는다.
  push->Receive("ok", [weak_self](Push& joined, const Payload&) {
    auto self = weak_self.lock();
    if (self && self->join_ref_ == joined.JoinRef()) {
      self->state_ = ChannelState::kJoined;
    }
  });
  push->Receive("error", [weak_self](Push& failed, const Payload&) {
    auto self = weak_self.lock();
    if (self && self->join_ref_ == failed.JoinRef()) {
      self->state_ = ChannelState::kErrored;
    }
  });
  return push;
}

std::shared_ptr<Push> Channel::Leave() {
  state_ = ChannelState::kLeaving;
  auto push = std::make_shared<Push>(std::string{event::kLeave}, topic_, Payload::object(), Ref::Generate(),
                                     join_ref_);
  std::weak_ptr<Channel> weak_self = weak_from_this();
  std::weak_ptr<Socket> weak_socket = socket_;
  Dispatch(push);
  push->Receive("ok", [weak_self, weak_socket](Push&, const Payload&) {
    auto self = weak_self.lock();
    if (!self) {
      return;
    }
    self->handlers_.clear();
    self->presence_.ClearCallbacks();
    self->presence_update_handler_ = nullptr;
    self->state_ = ChannelState::kClosed;
    if (auto socket = weak_socket.lock()) {
      socket->Unregister(self->topic_, self.get());
    }
  });
  push->Receive("error", [weak_self](Push&, const Payload&) {
    if (auto self = weak_self.lock()) {
      self->state_ = ChannelState::kErrored;
    }
  });
  return push;
}

void Channel::JoinIfNeeded(JoinCallback callback) {
  if (state_ == ChannelState::kJoined) {
    callback(std::nullopt, *this);
    return;
  }
  auto self = shared_from_this();
  Join()->Always([self, callback = std::move(callback)](Push& push) { callback(push.LastError(), *self); });
}

std::shared_ptr<Push> Channel::Send(const std::string& event, const Payload& payload) {
  return Dispatch(std::make_shared<Push>(event, topic_, payload, Ref::Generate(), join_ref_));
}

Channel& Channel::On(const std::string& event, ResponseHandler handler) {
  handlers_[event] = std::move(handler);
  return *this;
}

Channel& Channel::OnPresenceUpdate(PresenceHandler handler) {
  presence_update_handler_ = std::move(handler);
  return *this;
}

void Channel::Received(const Response& response) {
  if (!response.JoinRef().empty() && !join_ref_.empty() && response.JoinRef() != join_ref_) {
    return;
  }
  if (response.Event() == event::kError) {
    state_ = ChannelState::kErrored;
  } else if (response.Event() == event::kClose) {
    state_ = ChannelState::kClosed;
  }
  auto it = handlers_.find(response.Event());
  if (it == handlers_.end()) {
    return;
  }
  // 핸들러가 자기 자신을 교체할 수 있으므로 복사본으로 호출한다.
  auto handler = it->second;
  handler(*this, response);
}

void Channel::HandleConnectionLost() {
  if (state_ == ChannelState::kJoined || state_ == ChannelState::kJoining || state_ == ChannelState::kLeaving) {
    state_ = ChannelState::kErrored;
  }
}

std::shared_ptr<Push> Channel::Dispatch(const std::shared_ptr<Push>& push) {
  auto socket = socket_.lock();
  if (!socket) {
    push->HandleError(PushError::kNotConnected);
    return push;
  }
  return socket->Send(push);
}

}  // namespace phoenix
