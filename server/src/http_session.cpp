/*
 * 설명: HTTP 요청을 처리하고 상태 페이지/메트릭/헬스체크/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/status_metrics_test.cpp, server/tests/e2e/relay_flow_test.cpp
 */
#include "relay/http_session.hpp"

#include <algorithm>
#include <cstdio>
#include <sstream>
#include <unordered_map>

#include <boost/beast/websocket.hpp>

#include "relay/api_response.hpp"
#include "relay/websocket_session.hpp"

namespace relay {

namespace {
constexpr const char* kServerName = "position-relay";
constexpr const char* kVersion = "v1.0.0";
constexpr const char* kGamePath = "/game";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::string EscapeHtml(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

std::string FormatFixed(double value, int precision) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
  return buf;
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<BroadcastDispatcher> dispatcher,
                         std::shared_ptr<IdentityGenerator> identity, std::shared_ptr<ResumeTokenStore> resume_tokens,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), registry_(std::move(registry)), dispatcher_(std::move(dispatcher)),
      identity_(std::move(identity)), resume_tokens_(std::move(resume_tokens)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::milliseconds(config_.ws_handshake_timeout_ms));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    if (observability_ && ec != boost::beast::error::timeout) {
      observability_->Log(LogLevel::kDebug, "http.read_failed", {{"error", ec.message()}});
    }
    return;
  }

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  if (boost::beast::websocket::is_upgrade(req_) && path == kGamePath) {
    return HandleWebSocket(query);
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", kVersion}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot();
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"players", {{"active", registry_->Size()}}},
                        {"broadcasts",
                         {{"total", snapshot.broadcasts},
                          {"deliveries", snapshot.deliveries},
                          {"failures", snapshot.delivery_failures}}},
                        {"decodeErrors", snapshot.decode_errors},
                        {"evictions", snapshot.evictions},
                        {"takeovers", snapshot.takeovers}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/status") {
    auto body = RenderStatusPage();
    res->result(http::status::ok);
    res->set(http::field::content_type, "text/html; charset=utf-8");
    res->body() = std::move(body);
    res->prepare_payload();
    return SendResponse(res);
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return SendJson(res, http::status::not_found,
                    MakeErrorEnvelope("not_found", "WebSocket 업그레이드는 /game 경로에서만 지원됩니다",
                                      {{"path", path}}));
  }

  SendJson(res, http::status::not_found,
           MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다", {{"path", path}}));
}

void HttpSession::SendJson(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                           const nlohmann::json& body) {
  res->result(status);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->prepare_payload();
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogLevel::kInfo, "http.request",
                        {{"traceId", trace_id_},
                         {"target", std::string(req_.target())},
                         {"status", res->result_int()},
                         {"latencyMs", latency}});
  }
  res->keep_alive(false);
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket(const std::string& query) {
  std::optional<std::string> requested_id;
  auto params = ParseQueryParams(query);
  auto id_it = params.find("id");
  if (id_it != params.end()) {
    auto token_it = params.find("token");
    // 식별자는 다른 플레이어에게도 공개되므로 본인만 받은 토큰이 맞아야 재사용을 허용한다.
    const char* reason = nullptr;
    if (!config_.allow_identity_resume || !resume_tokens_) {
      reason = "disabled";
    } else if (!IdentityGenerator::IsWellFormed(id_it->second)) {
      reason = "malformed_id";
    } else if (token_it == params.end() || !resume_tokens_->Validate(id_it->second, token_it->second)) {
      reason = "invalid_token";
    }
    if (reason == nullptr) {
      requested_id = id_it->second;
    } else if (observability_) {
      observability_->Log(LogLevel::kInfo, "ws.resume_rejected",
                          {{"requestedId", id_it->second}, {"reason", reason}});
    }
  }

  SessionOptions options;
  options.handshake_timeout = std::chrono::milliseconds(config_.ws_handshake_timeout_ms);
  options.read_timeout = std::chrono::milliseconds(config_.ws_read_timeout_ms);
  options.write_timeout = std::chrono::milliseconds(config_.ws_write_timeout_ms);
  options.max_queue_messages = config_.ws_queue_limit_messages;
  options.max_queue_bytes = config_.ws_queue_limit_bytes;

  std::make_shared<WebSocketSession>(std::move(stream_), std::move(requested_id), registry_, dispatcher_, identity_,
                                     config_.allow_identity_resume ? resume_tokens_ : nullptr, observability_,
                                     options)
      ->Run(std::move(req_));
}

std::string HttpSession::RenderStatusPage() const {
  auto players = registry_->Snapshot();
  std::sort(players.begin(), players.end(),
            [](const PlayerRecord& a, const PlayerRecord& b) { return a.id < b.id; });
  const auto now = ConnectionRegistry::Clock::now();

  std::ostringstream html;
  html << "<html><body>";
  html << "<h1>Position Relay Status</h1>";
  html << "<p>Connected players: " << players.size() << "</p>";
  html << "<p>Generated at " << FormatUtcTimestamp(std::chrono::system_clock::now()) << "</p>";
  html << "<table border='1'><tr><th>ID</th><th>Position</th><th>Last Seen</th></tr>";
  for (const auto& player : players) {
    auto age = std::chrono::duration<double>(now - player.last_seen).count();
    html << "<tr><td>" << EscapeHtml(player.id) << "</td><td>(" << FormatFixed(player.x, 2) << ", "
         << FormatFixed(player.y, 2) << ")</td><td>" << FormatFixed(age, 1) << "s ago</td></tr>";
  }
  html << "</table></body></html>";
  return html.str();
}

}  // namespace relay
