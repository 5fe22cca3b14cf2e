/*
 * 설명: 이동 이벤트를 단일 소비자 FIFO로 직렬화해 보낸 사람을 제외한 모든 연결에 전파한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/broadcast_dispatcher_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include "relay/connection_registry.hpp"
#include "relay/observability.hpp"
#include "relay/protocol.hpp"

namespace relay {

struct BroadcastResult {
  std::size_t recipients{0};
  std::size_t delivered{0};
};

class BroadcastDispatcher : public std::enable_shared_from_this<BroadcastDispatcher> {
 public:
  BroadcastDispatcher(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                      std::shared_ptr<Observability> observability = nullptr);

  // on_accepted는 이벤트가 큐에서 꺼내져 전파된 뒤 디스패처 스트랜드에서 호출된다.
  // 발행한 세션은 이 콜백을 받은 뒤에야 다음 메시지를 읽는다.
  bool Publish(MoveEvent event, std::function<void()> on_accepted = {});
  void Stop();
  bool Stopped() const { return stopped_.load(); }

 private:
  BroadcastResult Deliver(const MoveEvent& event);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::atomic<bool> stopped_{false};
};

}  // namespace relay
