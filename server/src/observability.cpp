/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 */
#include "relay/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>

namespace relay {

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::RecordBroadcast(std::uint64_t delivered, std::uint64_t failed) {
  broadcasts_.fetch_add(1);
  deliveries_.fetch_add(delivered);
  delivery_failures_.fetch_add(failed);
}

void Observability::IncrementDecodeError() { decode_errors_.fetch_add(1); }

void Observability::AddEvictions(std::uint64_t count) { evictions_.fetch_add(count); }

void Observability::IncrementTakeover() { takeovers_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.broadcasts = broadcasts_.load();
  snapshot.deliveries = deliveries_.load();
  snapshot.delivery_failures = delivery_failures_.load();
  snapshot.decode_errors = decode_errors_.load();
  snapshot.evictions = evictions_.load();
  snapshot.takeovers = takeovers_.load();
  return snapshot;
}

void Observability::Log(LogLevel level, std::string_view event, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["level"] = LogLevelName(level);
  log_json["event"] = event;
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << line << std::endl;
}

}  // namespace relay
