/*
 * 설명: 서버 수명주기와 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp, server/tests/e2e/sweep_takeover_test.cpp,
 *         server/tests/e2e/status_metrics_test.cpp
 */
#include "relay/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "relay/http_session.hpp"

namespace relay {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<BroadcastDispatcher> dispatcher,
           std::shared_ptr<IdentityGenerator> identity, std::shared_ptr<ResumeTokenStore> resume_tokens,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), registry_(std::move(registry)),
        dispatcher_(std::move(dispatcher)), identity_(std::move(identity)), resume_tokens_(std::move(resume_tokens)),
        observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->registry_, self->dispatcher_,
                                          self->identity_, self->resume_tokens_, self->observability_)
                ->Run();
          } else if (ec != boost::asio::error::operation_aborted && self->observability_) {
            self->observability_->Log(LogLevel::kWarn, "listener.accept_failed", {{"error", ec.message()}});
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<IdentityGenerator> identity_;
  std::shared_ptr<ResumeTokenStore> resume_tokens_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config),
      thread_count_(config.worker_threads > 0 ? config.worker_threads
                                              : std::max(1u, std::thread::hardware_concurrency())),
      ioc_(static_cast<int>(thread_count_)), work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_) {
  ValidateConfig(config_);
  observability_ = std::make_shared<Observability>(ParseLogLevel(config_.log_level).value_or(LogLevel::kInfo));
  registry_ = std::make_shared<ConnectionRegistry>(observability_);
  identity_ = std::make_shared<IdentityGenerator>(config_.player_id_bytes, observability_);
  resume_tokens_ =
      std::make_shared<ResumeTokenStore>(std::chrono::milliseconds(config_.resume_token_ttl_ms), observability_);
  dispatcher_ = std::make_shared<BroadcastDispatcher>(ioc_, registry_, observability_);
  sweeper_ = std::make_shared<IdleSweeper>(ioc_, registry_, std::chrono::milliseconds(config_.sweep_interval_ms),
                                           std::chrono::milliseconds(config_.idle_timeout_ms), observability_);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  if (running_.exchange(true)) {
    return;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  try {
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, registry_, dispatcher_, identity_, resume_tokens_,
                                           observability_);
  } catch (...) {
    running_ = false;
    throw;
  }
  sweeper_->Start();
  listener_->Run();
  observability_->Log(LogLevel::kInfo, "server.started",
                      {{"port", ListeningPort()},
                       {"threads", thread_count_},
                       {"sweepIntervalMs", config_.sweep_interval_ms},
                       {"idleTimeoutMs", config_.idle_timeout_ms}});
  // Run()에서는 현재 스레드도 이벤트 루프에 참여한다.
  RunWorkers(std::max(1u, thread_count_ - 1));
}

void ServerApp::Run() {
  Start();
  signals_.add(SIGINT);
  signals_.add(SIGTERM);
  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogLevel::kInfo, "server.signal", {{"signal", signal_number}});
    Shutdown();
  });
  ioc_.run();
  Stop();
}

void ServerApp::RunWorkers(unsigned int count) {
  for (unsigned int i = 0; i < count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Shutdown() {
  dispatcher_->Stop();
  sweeper_->Stop();
  if (listener_) {
    listener_->Stop();
  }
  work_guard_.reset();
  ioc_.stop();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
  observability_->Log(LogLevel::kInfo, "server.stopped", {{"players", registry_->Size()}});
}

unsigned short ServerApp::ListeningPort() const { return listener_ ? listener_->Port() : 0; }

}  // namespace relay
