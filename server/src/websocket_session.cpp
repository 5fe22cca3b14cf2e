/*
 * 설명: WebSocket 핸드셰이크 후 플레이어를 등록하고, 초기 상태를 보내고, 이동 메시지를 검증해 브로드캐스트한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/e2e/relay_flow_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#include "relay/websocket_session.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "relay/protocol.hpp"

namespace relay {
namespace {
constexpr std::size_t kMaxLoggedPayload = 256;

std::string Truncate(const std::string& data) {
  if (data.size() <= kMaxLoggedPayload) {
    return data;
  }
  return data.substr(0, kMaxLoggedPayload) + "...";
}

// 클라이언트가 정상적으로 떠났거나 서버가 먼저 닫은 경우.
bool IsExpectedClose(const boost::beast::error_code& ec) {
  return ec == boost::beast::websocket::error::closed || ec == boost::asio::error::eof ||
         ec == boost::asio::error::operation_aborted || ec == boost::asio::error::connection_reset;
}
}  // namespace

WebSocketSession::WebSocketSession(boost::beast::tcp_stream stream, std::optional<std::string> requested_id,
                                   std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<BroadcastDispatcher> dispatcher,
                                   std::shared_ptr<IdentityGenerator> identity,
                                   std::shared_ptr<ResumeTokenStore> resume_tokens,
                                   std::shared_ptr<Observability> observability, const SessionOptions& options)
    : ws_(std::move(stream)), read_timer_(ws_.get_executor()), write_timer_(ws_.get_executor()),
      requested_id_(std::move(requested_id)), registry_(std::move(registry)), dispatcher_(std::move(dispatcher)),
      identity_(std::move(identity)), resume_tokens_(std::move(resume_tokens)),
      observability_(std::move(observability)), options_(options) {}

WebSocketSession::~WebSocketSession() { Release(); }

void WebSocketSession::Run(boost::beast::http::request<boost::beast::http::string_body> req) {
  boost::asio::dispatch(ws_.get_executor(), [self = shared_from_this(), req = std::move(req)]() {
    boost::beast::get_lowest_layer(self->ws_).expires_never();
    // 읽기 데드라인은 메시지마다 read_timer_로 건다.
    boost::beast::websocket::stream_base::timeout timeouts{};
    timeouts.handshake_timeout = self->options_.handshake_timeout;
    timeouts.idle_timeout = boost::beast::websocket::stream_base::none();
    timeouts.keep_alive_pings = false;
    self->ws_.set_option(timeouts);
    self->ws_.set_option(
        boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
          res.set(boost::beast::http::field::server, "position-relay");
        }));
    self->ws_.async_accept(req, [self](boost::beast::error_code ec) { self->OnAccept(ec); });
  });
}

void WebSocketSession::OnAccept(boost::beast::error_code ec) {
  if (ec) {
    state_ = State::kClosed;
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "ws.upgrade_failed", {{"error", ec.message()}});
    }
    return;
  }
  Synchronize();
}

void WebSocketSession::Synchronize() {
  handle_ = registry_->NextHandle();
  player_id_ = requested_id_ ? *requested_id_ : identity_->Generate();
  PlayerRecord record{player_id_, 0.0, 0.0, ConnectionRegistry::Clock::now()};
  registry_->Add(handle_, shared_from_this(), record);
  registered_ = true;
  state_ = State::kSynced;

  ws_.text(true);
  std::optional<std::string> resume_token;
  if (resume_tokens_) {
    resume_token = resume_tokens_->IssueToken(player_id_);
  }
  EnqueueMessage(EncodeWelcome(record, resume_token), false);

  std::size_t peers = 0;
  for (const auto& other : registry_->Snapshot()) {
    if (other.id == player_id_) {
      continue;
    }
    MoveEvent existing;
    existing.player_id = other.id;
    existing.x = other.x;
    existing.y = other.y;
    EnqueueMessage(EncodeMoveEvent(existing), false);
    ++peers;
  }
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "ws.connected",
                        {{"playerId", player_id_}, {"connection", handle_.value}, {"existingPlayers", peers},
                         {"resumed", requested_id_.has_value()}});
  }

  state_ = State::kActive;
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  reading_ = true;
  read_timer_.expires_after(options_.read_timeout);
  read_timer_.async_wait([self](boost::beast::error_code ec) { self->OnReadTimeout(ec); });
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnReadTimeout(boost::beast::error_code ec) {
  if (ec == boost::asio::error::operation_aborted || !reading_ || closing_) {
    return;
  }
  // 소켓을 닫으면 대기 중인 async_read가 오류로 끝나고 OnRead에서 정리된다.
  read_timed_out_ = true;
  closing_ = true;
  boost::beast::get_lowest_layer(ws_).close();
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  reading_ = false;
  read_timer_.cancel();
  if (ec) {
    if (observability_) {
      if (read_timed_out_) {
        observability_->Log(LogLevel::kInfo, "ws.read_timeout", {{"playerId", player_id_}});
      } else if (IsExpectedClose(ec) || closing_) {
        observability_->Log(LogLevel::kDebug, "ws.closed", {{"playerId", player_id_}});
      } else {
        observability_->Log(LogLevel::kWarn, "ws.read_error", {{"playerId", player_id_}, {"error", ec.message()}});
      }
    }
    Release();
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  HandleMessage(data);
}

void WebSocketSession::HandleMessage(const std::string& data) {
  std::string error_message;
  auto message = DecodeClientMessage(data, error_message);
  if (!message) {
    if (observability_) {
      observability_->IncrementDecodeError();
      observability_->Log(LogLevel::kWarn, "ws.decode_failed",
                          {{"playerId", player_id_}, {"error", error_message}, {"raw", Truncate(data)}});
    }
    return DoRead();
  }

  if (message->type != kMoveType) {
    if (observability_) {
      observability_->Log(LogLevel::kInfo, "ws.ignored_type", {{"playerId", player_id_}, {"type", message->type}});
    }
    return DoRead();
  }

  // 클라이언트가 보낸 playerId는 신뢰하지 않는다.
  message->player_id = player_id_;
  if (!registry_->Update(handle_, message->x, message->y)) {
    // 이미 스윕되었거나 다른 연결에 식별자를 빼앗겼다. 곧 닫힌다.
    return DoRead();
  }

  auto self = shared_from_this();
  bool accepted = dispatcher_->Publish(std::move(*message), [self]() {
    boost::asio::post(self->ws_.get_executor(), [self]() { self->DoRead(); });
  });
  if (!accepted) {
    CloseWithReason(boost::beast::websocket::close_code::going_away, "server_shutdown");
    Release();
  }
}

bool WebSocketSession::Send(std::string message) {
  if (closing_) {
    return false;
  }
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message), true);
  });
  return true;
}

void WebSocketSession::Close() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
    self->CloseWithReason(boost::beast::websocket::close_code::going_away, "closed_by_server");
  });
}

void WebSocketSession::EnqueueMessage(std::string message, bool bounded) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (bounded &&
      (send_queue_.size() >= options_.max_queue_messages || queued_bytes_ + message_size > options_.max_queue_bytes)) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "ws.backpressure_exceeded",
                          {{"playerId", player_id_}, {"queued", send_queue_.size()}, {"queuedBytes", queued_bytes_}});
    }
    CloseWithReason(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
    // 닫힘 핸드셰이크를 기다리지 않고 브로드캐스트 대상에서 바로 뺀다.
    Release();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  write_timer_.expires_after(options_.write_timeout);
  write_timer_.async_wait([self](boost::beast::error_code ec) { self->OnWriteTimeout(ec); });
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  write_timer_.cancel();
  writing_ = false;
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    if (observability_ && !IsExpectedClose(ec)) {
      observability_->Log(LogLevel::kWarn, "ws.write_failed",
                          {{"playerId", player_id_}, {"error", ec.message()}, {"synced", state_ == State::kActive}});
    }
    closing_ = true;
    send_queue_.clear();
    queued_bytes_ = 0;
    boost::beast::get_lowest_layer(ws_).close();
    Release();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::OnWriteTimeout(boost::beast::error_code ec) {
  if (ec == boost::asio::error::operation_aborted || !writing_) {
    return;
  }
  if (observability_) {
    observability_->Log(LogLevel::kWarn, "ws.write_timeout", {{"playerId", player_id_}});
  }
  // 소켓을 닫으면 진행 중인 async_write가 오류로 끝나고 OnWrite에서 정리된다.
  closing_ = true;
  boost::beast::get_lowest_layer(ws_).close();
}

void WebSocketSession::CloseWithReason(boost::beast::websocket::close_code code, const char* reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  // 진행 중인 쓰기의 버퍼는 완료 전까지 살아 있어야 한다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    queued_bytes_ -= send_queue_.back().size();
    send_queue_.pop_back();
  }
  if (state_ == State::kConnecting) {
    boost::beast::get_lowest_layer(ws_).close();
    return;
  }
  boost::beast::websocket::close_reason close_reason{code};
  close_reason.reason = reason;
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code ec) {
    if (ec) {
      boost::beast::get_lowest_layer(self->ws_).close();
    }
  });
}

void WebSocketSession::Release() {
  if (released_) {
    return;
  }
  released_ = true;
  closing_ = true;
  state_ = State::kClosed;
  if (registered_) {
    registry_->Delete(handle_);
    if (observability_) {
      observability_->Log(LogLevel::kInfo, "ws.disconnected", {{"playerId", player_id_}});
    }
  }
}

}  // namespace relay
