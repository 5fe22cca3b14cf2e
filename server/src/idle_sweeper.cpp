/*
 * 설명: steady_timer 틱마다 SweepStale을 호출해 비활성 연결을 제거한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/idle_sweeper_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#include "relay/idle_sweeper.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace relay {

IdleSweeper::IdleSweeper(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                         std::chrono::milliseconds interval, std::chrono::milliseconds idle_timeout,
                         std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), timer_(ioc), registry_(std::move(registry)), interval_(interval),
      idle_timeout_(idle_timeout), observability_(std::move(observability)) {}

void IdleSweeper::Start() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    if (self->running_) {
      return;
    }
    self->running_ = true;
    self->ScheduleTick();
  });
}

void IdleSweeper::Stop() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->running_ = false;
    self->timer_.cancel();
  });
}

void IdleSweeper::ScheduleTick() {
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait(
      boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec) { self->OnTick(ec); }));
}

void IdleSweeper::OnTick(const boost::system::error_code& ec) {
  if (ec || !running_) {
    return;
  }
  auto evicted = registry_->SweepStale(idle_timeout_);
  if (observability_ && evicted > 0) {
    observability_->Log(LogLevel::kInfo, "sweeper.tick",
                        {{"evicted", evicted}, {"remaining", registry_->Size()}});
  }
  ScheduleTick();
}

}  // namespace relay
