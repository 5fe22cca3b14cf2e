/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/status_metrics_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view value);
std::string_view LogLevelName(LogLevel level);

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t broadcasts{0};
  std::uint64_t deliveries{0};
  std::uint64_t delivery_failures{0};
  std::uint64_t decode_errors{0};
  std::uint64_t evictions{0};
  std::uint64_t takeovers{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void RecordBroadcast(std::uint64_t delivered, std::uint64_t failed);
  void IncrementDecodeError();
  void AddEvictions(std::uint64_t count);
  void IncrementTakeover();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  // 한 줄짜리 JSON 객체로 출력한다. fields는 객체여야 한다.
  void Log(LogLevel level, std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> broadcasts_{0};
  std::atomic<std::uint64_t> deliveries_{0};
  std::atomic<std::uint64_t> delivery_failures_{0};
  std::atomic<std::uint64_t> decode_errors_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> takeovers_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace relay
