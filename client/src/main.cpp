/*
 * 설명: 환경설정으로 소켓을 만들어 토픽에 join하고 수신 프레임을 출력하는 데모 진입점.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: client/tests/e2e/websocket_transport_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "phoenix/config.hpp"
#include "phoenix/logger.hpp"
#include "phoenix/socket.hpp"
#include "phoenix/websocket_transport.hpp"

int main() {
  using namespace phoenix;
  ClientConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 로드 실패: " << ex.what() << "\n";
    return 1;
  }
  auto logger = std::make_shared<Logger>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));

  boost::asio::io_context ioc{1};
  std::shared_ptr<Socket> socket;
  try {
    socket = CreateWebSocketSocket(ioc, config.url, config.params, ToSocketOptions(config), logger,
                                   config.ws_queue_limit_messages, config.ws_queue_limit_bytes);
  } catch (const std::exception& ex) {
    std::cerr << "소켓 생성 실패: " << ex.what() << "\n";
    return 1;
  }

  std::weak_ptr<Socket> weak_socket = socket;
  socket->SetOnConnect([weak_socket, topic = config.topic, logger]() {
    auto socket = weak_socket.lock();
    if (!socket) {
      return;
    }
    auto channel = socket->CreateChannel(topic);
    channel->OnPresenceUpdate([](Channel& joined, const Presence& presence) {
      std::cout << joined.Topic() << " presence: " << presence.GetState().size() << "명\n";
    });
    channel->Join()
        ->Receive("ok", [logger, topic](Push&, const Payload&) {
          logger->Log(LogLevel::kInfo, {"channel.joined", "join 완료", topic, std::nullopt, std::nullopt});
        })
        .Receive("error", [logger, topic](Push&, const Payload& response) {
          logger->Log(LogLevel::kWarn, {"channel.join_failed", response.dump(), topic, std::nullopt, std::nullopt});
        });
  });
  socket->SetOnResponse([](const Response& response) {
    std::cout << response.Topic() << " " << response.Event() << " " << response.GetPayload().dump() << "\n";
  });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&ioc, weak_socket](const boost::system::error_code& ec, int) {
    if (ec) {
      return;
    }
    std::cout << "종료 신호 수신, 연결을 닫습니다\n";
    if (auto socket = weak_socket.lock()) {
      socket->Disconnect();
    }
    ioc.stop();
  });

  socket->Connect();
  ioc.run();
  return 0;
}
