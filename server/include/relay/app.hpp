/*
 * 설명: 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp, server/tests/e2e/sweep_takeover_test.cpp,
 *         server/tests/e2e/status_metrics_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include "relay/broadcast_dispatcher.hpp"
#include "relay/config.hpp"
#include "relay/connection_registry.hpp"
#include "relay/identity.hpp"
#include "relay/idle_sweeper.hpp"
#include "relay/observability.hpp"
#include "relay/resume_tokens.hpp"

namespace relay {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  // 리스너를 열고 디스패처/스위퍼를 띄운 뒤 워커 스레드를 시작한다. 바인드 실패 시 예외를 던진다.
  void Start();
  // Start() 후 현재 스레드에서도 이벤트 루프를 돌리며 SIGINT/SIGTERM까지 블록한다.
  void Run();
  void Stop();

  unsigned short ListeningPort() const;
  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ConnectionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers(unsigned int count);
  void Shutdown();

  AppConfig config_;
  unsigned int thread_count_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<IdentityGenerator> identity_;
  std::shared_ptr<ResumeTokenStore> resume_tokens_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<IdleSweeper> sweeper_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace relay
