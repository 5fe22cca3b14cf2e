/*
 * 설명: HTTP 연결을 처리하고 상태/메트릭/헬스 엔드포인트 및 /game WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/status_metrics_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "relay/broadcast_dispatcher.hpp"
#include "relay/config.hpp"
#include "relay/connection_registry.hpp"
#include "relay/identity.hpp"
#include "relay/observability.hpp"
#include "relay/resume_tokens.hpp"

namespace relay {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<BroadcastDispatcher> dispatcher,
              std::shared_ptr<IdentityGenerator> identity, std::shared_ptr<ResumeTokenStore> resume_tokens,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendJson(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);
  void HandleWebSocket(const std::string& query);
  std::string RenderStatusPage() const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<BroadcastDispatcher> dispatcher_;
  std::shared_ptr<IdentityGenerator> identity_;
  std::shared_ptr<ResumeTokenStore> resume_tokens_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace relay
