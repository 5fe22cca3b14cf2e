/*
 * 설명: WebSocket 연결 하나의 핸드셰이크, 초기 동기화, 수신 루프, 송신 큐와 정리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/broadcast_dispatcher.hpp"
#include "relay/connection_registry.hpp"
#include "relay/identity.hpp"
#include "relay/observability.hpp"
#include "relay/peer_connection.hpp"
#include "relay/resume_tokens.hpp"

namespace relay {

struct SessionOptions {
  std::chrono::milliseconds handshake_timeout{30000};
  std::chrono::milliseconds read_timeout{120000};
  std::chrono::milliseconds write_timeout{5000};
  std::size_t max_queue_messages{256};
  std::size_t max_queue_bytes{1048576};
};

class WebSocketSession : public PeerConnection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  enum class State { kConnecting, kSynced, kActive, kClosed };

  WebSocketSession(boost::beast::tcp_stream stream, std::optional<std::string> requested_id,
                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<BroadcastDispatcher> dispatcher,
                   std::shared_ptr<IdentityGenerator> identity, std::shared_ptr<ResumeTokenStore> resume_tokens,
                   std::shared_ptr<Observability> observability, const SessionOptions& options);
  ~WebSocketSession() override;

  void Run(boost::beast::http::request<boost::beast::http::string_body> req);

  bool Send(std::string message) override;
  void Close() override;

 private:
  void OnAccept(boost::beast::error_code ec);
  void Synchronize();
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void OnReadTimeout(boost::beast::error_code ec);
  void HandleMessage(const std::string& data);
  void EnqueueMessage(std::string message, bool bounded);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void OnWriteTimeout(boost::beast::error_code ec);
  void CloseWithReason(boost::beast::websocket::close_code code, const char* reason);
  void Release();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  boost::asio::steady_timer read_timer_;
  boost::asio::steady_timer write_timer_;
  std::optional<std::string> requested_id_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<IdentityGenerator> identity_;
  std::shared_ptr<ResumeTokenStore> resume_tokens_;
  std::shared_ptr<Observability> observability_;
  SessionOptions options_;
  State state_{State::kConnecting};
  ConnectionHandle handle_{};
  std::string player_id_;
  bool registered_{false};
  bool released_{false};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool reading_{false};
  bool read_timed_out_{false};
  std::atomic<bool> closing_{false};
};

}  // namespace relay
