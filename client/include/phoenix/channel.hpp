/*
 * 설명: 토픽 단위 세션(Channel)의 join/leave 상태 머신과 이벤트 라우팅을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/unit/channel_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "phoenix/presence.hpp"
#include "phoenix/push.hpp"
#include "phoenix/response.hpp"

namespace phoenix {

class Socket;

enum class ChannelState {
  kClosed,
  kErrored,
  kJoined,
  kJoining,
  kLeaving,
};

std::string_view ToString(ChannelState state);

class Channel : public std::enable_shared_from_this<Channel> {
 public:
  using ResponseHandler = std::function<void(Channel&, const Response&)>;
  using PresenceHandler = std::function<void(Channel&, const Presence&)>;
  using JoinCallback = std::function<void(std::optional<PushError> error, Channel&)>;

  Channel(std::weak_ptr<Socket> socket, std::string topic, Payload params);

  std::shared_ptr<Push> Join();
  std::shared_ptr<Push> Leave();
  void JoinIfNeeded(JoinCallback callback);
  std::shared_ptr<Push> Send(const std::string& event, const Payload& payload);

  // 이벤트당 핸들러는 하나이며 다시 등록하면 교체된다.
  Channel& On(const std::string& event, ResponseHandler handler);
  Channel& OnPresenceUpdate(PresenceHandler handler);

  void Received(const Response& response);
  void HandleConnectionLost();

  const std::string& Topic() const { return topic_; }
  const Payload& Params() const { return params_; }
  ChannelState State() const { return state_; }
  const std::string& JoinRef() const { return join_ref_; }
  Presence& GetPresence() { return presence_; }
  const Presence& GetPresence() const { return presence_; }
  bool HasHandler(const std::string& event) const { return handlers_.count(event) > 0; }

 private:
  void InstallPresenceHandlers();
  std::shared_ptr<Push> Dispatch(const std::shared_ptr<Push>& push);

  std::weak_ptr<Socket> socket_;
  std::string topic_;
  Payload params_;
  ChannelState state_{ChannelState::kClosed};
  std::string join_ref_;
  Presence presence_;
  std::unordered_map<std::string, ResponseHandler> handlers_;
  PresenceHandler presence_update_handler_;
};

}  // namespace phoenix
