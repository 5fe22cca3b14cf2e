/*
 * 설명: 일정 주기로 레지스트리를 훑어 오래 조용한 연결을 쫓아낸다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/idle_sweeper_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "relay/connection_registry.hpp"
#include "relay/observability.hpp"

namespace relay {

class IdleSweeper : public std::enable_shared_from_this<IdleSweeper> {
 public:
  IdleSweeper(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
              std::chrono::milliseconds interval, std::chrono::milliseconds idle_timeout,
              std::shared_ptr<Observability> observability = nullptr);

  void Start();
  void Stop();

 private:
  void ScheduleTick();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds idle_timeout_;
  std::shared_ptr<Observability> observability_;
  bool running_{false};
};

}  // namespace relay
