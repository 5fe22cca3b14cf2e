/*
 * 설명: 디스패처 스트랜드에서 이벤트를 하나씩 꺼내 다른 모든 연결의 송신 큐로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/broadcast_dispatcher_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/broadcast_dispatcher.hpp"

#include <string>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

namespace relay {

BroadcastDispatcher::BroadcastDispatcher(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                                         std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), registry_(std::move(registry)),
      observability_(std::move(observability)) {}

bool BroadcastDispatcher::Publish(MoveEvent event, std::function<void()> on_accepted) {
  if (stopped_.load()) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "broadcast.rejected_stopped", {{"playerId", event.player_id}});
    }
    return false;
  }
  boost::asio::post(strand_, [self = shared_from_this(), event = std::move(event),
                              on_accepted = std::move(on_accepted)]() {
    if (!self->stopped_.load()) {
      self->Deliver(event);
    }
    if (on_accepted) {
      on_accepted();
    }
  });
  return true;
}

void BroadcastDispatcher::Stop() { stopped_.store(true); }

BroadcastResult BroadcastDispatcher::Deliver(const MoveEvent& event) {
  struct Target {
    std::string player_id;
    std::shared_ptr<PeerConnection> connection;
  };
  std::vector<Target> targets;
  registry_->ForEach([&event, &targets](ConnectionHandle, const PlayerRecord& record,
                                        const std::shared_ptr<PeerConnection>& connection) {
    if (record.id != event.player_id) {
      targets.push_back(Target{record.id, connection});
    }
    return true;
  });

  // 쓰기는 락 밖에서 한다. 실패한 피어는 세션 루프나 스위퍼가 정리한다.
  const auto payload = EncodeMoveEvent(event);
  BroadcastResult result;
  result.recipients = targets.size();
  for (const auto& target : targets) {
    if (target.connection && target.connection->Send(payload)) {
      ++result.delivered;
      if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
        observability_->Log(LogLevel::kDebug, "broadcast.sent",
                            {{"from", event.player_id}, {"to", target.player_id}, {"x", event.x}, {"y", event.y}});
      }
      continue;
    }
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "broadcast.send_failed",
                          {{"from", event.player_id}, {"to", target.player_id}});
    }
  }

  if (observability_) {
    observability_->RecordBroadcast(result.delivered, result.recipients - result.delivered);
    observability_->Log(LogLevel::kDebug, "broadcast.complete",
                        {{"playerId", event.player_id}, {"sent", result.delivered}, {"recipients", result.recipients}});
  }
  return result;
}

}  // namespace relay
