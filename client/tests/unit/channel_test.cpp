#include <memory>
#include <optional>
#include <string>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "common/mock_transport.hpp"
#include "phoenix/channel.hpp"
#include "phoenix/socket.hpp"

namespace {

class ChannelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    transport_ = std::make_shared<phoenix::test::MockTransport>();
    socket_ = std::make_shared<phoenix::Socket>(ioc_, transport_, phoenix::SocketOptions{.enable_logging = false});
    socket_->Connect();
    channel_ = socket_->CreateChannel("room:lobby", {{"token", "abc"}});
  }

  void ReplyTo(const nlohmann::json& frame, const std::string& status) {
    transport_->EmitFrame(
        {frame[0], frame[1], frame[2], "phx_reply", {{"status", status}, {"response", nlohmann::json::object()}}});
  }

  void JoinAndAck() {
    channel_->Join();
    ReplyTo(transport_->LastFrame(), "ok");
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<phoenix::test::MockTransport> transport_;
  std::shared_ptr<phoenix::Socket> socket_;
  std::shared_ptr<phoenix::Channel> channel_;
};

}  // namespace

TEST_F(ChannelTest, JoinIsJoiningUntilOkReply) {
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kClosed);
  auto push = channel_->Join();
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kJoining);

  auto frame = transport_->LastFrame();
  EXPECT_EQ(frame[2], "room:lobby");
  EXPECT_EQ(frame[3], "phx_join");
  EXPECT_EQ(frame[4]["token"], "abc");
  EXPECT_EQ(frame[0], frame[1]);
  EXPECT_EQ(frame[0], channel_->JoinRef());

  ReplyTo(frame, "ok");
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kJoined);
  EXPECT_EQ(push->ReceivedStatus(), "ok");
}

TEST_F(ChannelTest, ReplyWithOtherRefDoesNotJoin) {
  channel_->Join();
  auto frame = transport_->LastFrame();
  frame[1] = "unrelated";
  ReplyTo(frame, "ok");
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kJoining);
}

TEST_F(ChannelTest, JoinErrorReplySetsErrored) {
  channel_->Join();
  ReplyTo(transport_->LastFrame(), "error");
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kErrored);
}

TEST_F(ChannelTest, StaleJoinReplyIsIgnoredAfterRejoin) {
  auto first = channel_->Join();
  auto first_frame = transport_->LastFrame();
  channel_->Join();
  auto second_frame = transport_->LastFrame();
  ASSERT_NE(first_frame[0], second_frame[0]);

  ReplyTo(first_frame, "ok");
  EXPECT_TRUE(first->IsResolved());
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kJoining);

  ReplyTo(second_frame, "ok");
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kJoined);
}

TEST_F(ChannelTest, LeaveOkClearsHandlersAndUnregisters) {
  JoinAndAck();
  channel_->On("new_msg", [](phoenix::Channel&, const phoenix::Response&) {});
  int presence_changes = 0;
  channel_->GetPresence().SetOnStateChange([&presence_changes](const phoenix::Presence::State&) { ++presence_changes; });

  channel_->Leave();
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kLeaving);
  auto frame = transport_->LastFrame();
  EXPECT_EQ(frame[3], "phx_leave");
  EXPECT_EQ(frame[0], channel_->JoinRef());

  ReplyTo(frame, "ok");
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kClosed);
  EXPECT_FALSE(channel_->HasHandler("new_msg"));
  EXPECT_FALSE(channel_->HasHandler("presence_state"));
  EXPECT_EQ(socket_->Channels().count("room:lobby"), 0u);

  channel_->GetPresence().Sync(phoenix::Response("", phoenix::Ref{}, "room:lobby", "presence_state",
                                                 nlohmann::json::parse(R"({"u1": {"metas": [{"ref":"a"}]}})")));
  EXPECT_EQ(presence_changes, 0);
}

TEST_F(ChannelTest, LeaveErrorReplySetsErrored) {
  JoinAndAck();
  channel_->Leave();
  ReplyTo(transport_->LastFrame(), "error");
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kErrored);
  EXPECT_EQ(socket_->Channels().count("room:lobby"), 1u);
}

TEST_F(ChannelTest, SocketRemoveSendsLeave) {
  JoinAndAck();
  socket_->Remove(channel_);
  EXPECT_EQ(transport_->LastFrame()[3], "phx_leave");
  ReplyTo(transport_->LastFrame(), "ok");
  EXPECT_TRUE(socket_->Channels().empty());
}

TEST_F(ChannelTest, EventsRouteToRegisteredHandler) {
  JoinAndAck();
  int first = 0;
  int second = 0;
  nlohmann::json body;
  channel_->On("new_msg", [&first](phoenix::Channel&, const phoenix::Response&) { ++first; });
  channel_->On("new_msg", [&](phoenix::Channel& channel, const phoenix::Response& response) {
    ++second;
    body = response.GetPayload()["body"];
    EXPECT_EQ(&channel, channel_.get());
  });

  transport_->EmitFrame({nullptr, nullptr, "room:lobby", "new_msg", {{"body", "hello"}}});
  transport_->EmitFrame({nullptr, nullptr, "room:lobby", "unknown_event", nlohmann::json::object()});
  transport_->EmitFrame({nullptr, nullptr, "room:other", "new_msg", {{"body", "elsewhere"}}});

  EXPECT_EQ(first, 0);
  EXPECT_EQ(second, 1);
  EXPECT_EQ(body, "hello");
}

TEST_F(ChannelTest, MessageFromStaleJoinIsDropped) {
  JoinAndAck();
  int received = 0;
  channel_->On("new_msg", [&received](phoenix::Channel&, const phoenix::Response&) { ++received; });

  transport_->EmitFrame({"old-join", nullptr, "room:lobby", "new_msg", nlohmann::json::object()});
  EXPECT_EQ(received, 0);
  transport_->EmitFrame({channel_->JoinRef(), nullptr, "room:lobby", "new_msg", nlohmann::json::object()});
  EXPECT_EQ(received, 1);
}

TEST_F(ChannelTest, PresenceStateFiresUpdateButDiffDoesNot) {
  JoinAndAck();
  int updates = 0;
  channel_->OnPresenceUpdate([&updates](phoenix::Channel&, const phoenix::Presence&) { ++updates; });

  transport_->EmitFrame(nlohmann::json::array(
      {nullptr, nullptr, "room:lobby", "presence_state", nlohmann::json::parse(R"({"u1": {"metas": [{"ref":"a"}]}})")}));
  EXPECT_EQ(updates, 1);
  EXPECT_TRUE(channel_->GetPresence().Metas("u1").has_value());

  transport_->EmitFrame(nlohmann::json::array(
      {nullptr, nullptr, "room:lobby", "presence_diff",
       nlohmann::json::parse(R"({"joins": {"u2": {"metas": [{"ref":"b"}]}}, "leaves": {"u1": {"metas": [{"ref":"a"}]}}})")}));
  EXPECT_EQ(updates, 1);
  EXPECT_FALSE(channel_->GetPresence().Metas("u1").has_value());
  EXPECT_TRUE(channel_->GetPresence().Metas("u2").has_value());
}

TEST_F(ChannelTest, ServerErrorAndCloseChangeState) {
  JoinAndAck();
  transport_->EmitFrame({channel_->JoinRef(), channel_->JoinRef(), "room:lobby", "phx_error", nlohmann::json::object()});
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kErrored);

  JoinAndAck();
  transport_->EmitFrame({channel_->JoinRef(), channel_->JoinRef(), "room:lobby", "phx_close", nlohmann::json::object()});
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kClosed);
}

TEST_F(ChannelTest, JoinIfNeededJoinsOnceThenReturnsImmediately) {
  int calls = 0;
  std::optional<phoenix::PushError> last_error;
  auto callback = [&](std::optional<phoenix::PushError> error, phoenix::Channel&) {
    ++calls;
    last_error = error;
  };

  channel_->JoinIfNeeded(callback);
  EXPECT_EQ(calls, 0);
  ReplyTo(transport_->LastFrame(), "ok");
  EXPECT_EQ(calls, 1);
  EXPECT_FALSE(last_error.has_value());

  auto written = transport_->Written().size();
  channel_->JoinIfNeeded(callback);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(transport_->Written().size(), written);
}

TEST_F(ChannelTest, JoinIfNeededReportsNotConnected) {
  transport_->DropSilently();
  std::optional<phoenix::PushError> last_error;
  channel_->JoinIfNeeded([&last_error](std::optional<phoenix::PushError> error, phoenix::Channel&) { last_error = error; });
  EXPECT_EQ(last_error, phoenix::PushError::kNotConnected);
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kErrored);
}

TEST_F(ChannelTest, SendCarriesJoinRef) {
  JoinAndAck();
  channel_->Send("new_msg", {{"body", "hi"}});
  auto frame = transport_->LastFrame();
  EXPECT_EQ(frame[0], channel_->JoinRef());
  EXPECT_EQ(frame[3], "new_msg");
  EXPECT_EQ(frame[4]["body"], "hi");
}

TEST_F(ChannelTest, ConnectionLossErrorsChannel) {
  JoinAndAck();
  transport_->EmitClose(boost::asio::error::make_error_code(boost::asio::error::connection_reset));
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kErrored);
  EXPECT_TRUE(socket_->Channels().empty());
}

TEST_F(ChannelTest, ChannelOutlivingSocketFailsSends) {
  auto channel = socket_->CreateChannel("room:orphan");
  socket_.reset();
  auto push = channel->Send("new_msg", nlohmann::json::object());
  EXPECT_EQ(push->LastError(), phoenix::PushError::kNotConnected);
}

TEST_F(ChannelTest, RejoinAfterReconnectReceivesBroadcasts) {
  JoinAndAck();
  transport_->EmitClose(boost::asio::error::make_error_code(boost::asio::error::connection_reset));
  ASSERT_TRUE(socket_->Channels().empty());

  socket_->Connect();
  int received = 0;
  channel_->On("new_msg", [&received](phoenix::Channel&, const phoenix::Response&) { ++received; });
  JoinAndAck();
  EXPECT_EQ(channel_->State(), phoenix::ChannelState::kJoined);
  ASSERT_EQ(socket_->Channels().count("room:lobby"), 1u);
  EXPECT_EQ(socket_->Channels().at("room:lobby"), channel_);

  transport_->EmitFrame({nullptr, nullptr, "room:lobby", "new_msg", {{"body", "again"}}});
  EXPECT_EQ(received, 1);
}

TEST_F(ChannelTest, RejoinAfterLeaveRegistersAgain) {
  JoinAndAck();
  channel_->Leave();
  ReplyTo(transport_->LastFrame(), "ok");
  ASSERT_TRUE(socket_->Channels().empty());

  JoinAndAck();
  EXPECT_EQ(socket_->Channels().count("room:lobby"), 1u);
}

TEST_F(ChannelTest, RejoinDoesNotReplaceNewerChannelForTopic) {
  JoinAndAck();
  transport_->EmitClose(boost::asio::error::make_error_code(boost::asio::error::connection_reset));
  socket_->Connect();
  auto replacement = socket_->CreateChannel("room:lobby");

  channel_->Join();
  EXPECT_EQ(socket_->Channels().at("room:lobby"), replacement);
}
