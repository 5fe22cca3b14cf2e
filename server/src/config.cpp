/*
 * 설명: 환경변수에서 서버 설정을 읽고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "relay/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "relay/observability.hpp"

namespace relay {
namespace {
std::string GetEnv(const char* key, const char* def) {
  const char* val = std::getenv(key);
  return val ? std::string{val} : std::string{def};
}

std::size_t ParseUnsigned(const char* key, const std::string& value) {
  try {
    std::size_t idx = 0;
    if (!value.empty() && value.front() == '-') {
      throw std::invalid_argument(value);
    }
    auto parsed = std::stoull(value, &idx);
    if (idx != value.size()) {
      throw std::invalid_argument(value);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::logic_error&) {
    throw std::invalid_argument(std::string(key) + " 값이 올바르지 않습니다: " + value);
  }
}

bool ParseBool(const char* key, const std::string& value) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  throw std::invalid_argument(std::string(key) + " 값이 올바르지 않습니다: " + value);
}
}  // namespace

AppConfig LoadConfigFromEnv() {
  AppConfig cfg;
  auto port = ParseUnsigned("SERVER_PORT", GetEnv("SERVER_PORT", "8080"));
  if (port > std::numeric_limits<unsigned short>::max()) {
    throw std::invalid_argument("SERVER_PORT 범위를 벗어났습니다");
  }
  cfg.port = static_cast<unsigned short>(port);
  cfg.worker_threads = static_cast<unsigned int>(ParseUnsigned("WORKER_THREADS", GetEnv("WORKER_THREADS", "0")));
  cfg.log_level = GetEnv("LOG_LEVEL", "info");
  cfg.ws_handshake_timeout_ms = ParseUnsigned("WS_HANDSHAKE_TIMEOUT_MS", GetEnv("WS_HANDSHAKE_TIMEOUT_MS", "30000"));
  cfg.ws_read_timeout_ms = ParseUnsigned("WS_READ_TIMEOUT_MS", GetEnv("WS_READ_TIMEOUT_MS", "120000"));
  cfg.ws_write_timeout_ms = ParseUnsigned("WS_WRITE_TIMEOUT_MS", GetEnv("WS_WRITE_TIMEOUT_MS", "5000"));
  cfg.ws_queue_limit_messages = ParseUnsigned("WS_QUEUE_LIMIT_MESSAGES", GetEnv("WS_QUEUE_LIMIT_MESSAGES", "256"));
  cfg.ws_queue_limit_bytes = ParseUnsigned("WS_QUEUE_LIMIT_BYTES", GetEnv("WS_QUEUE_LIMIT_BYTES", "1048576"));
  cfg.sweep_interval_ms = ParseUnsigned("SWEEP_INTERVAL_MS", GetEnv("SWEEP_INTERVAL_MS", "10000"));
  cfg.idle_timeout_ms = ParseUnsigned("IDLE_TIMEOUT_MS", GetEnv("IDLE_TIMEOUT_MS", "30000"));
  cfg.player_id_bytes = ParseUnsigned("PLAYER_ID_BYTES", GetEnv("PLAYER_ID_BYTES", "8"));
  cfg.allow_identity_resume = ParseBool("ALLOW_IDENTITY_RESUME", GetEnv("ALLOW_IDENTITY_RESUME", "true"));
  cfg.resume_token_ttl_ms = ParseUnsigned("RESUME_TOKEN_TTL_MS", GetEnv("RESUME_TOKEN_TTL_MS", "300000"));
  ValidateConfig(cfg);
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  if (!ParseLogLevel(config.log_level)) {
    throw std::invalid_argument("LOG_LEVEL 값이 올바르지 않습니다: " + config.log_level);
  }
  if (config.ws_handshake_timeout_ms == 0) {
    throw std::invalid_argument("WS_HANDSHAKE_TIMEOUT_MS는 0보다 커야 합니다");
  }
  if (config.ws_read_timeout_ms == 0) {
    throw std::invalid_argument("WS_READ_TIMEOUT_MS는 0보다 커야 합니다");
  }
  if (config.ws_write_timeout_ms == 0) {
    throw std::invalid_argument("WS_WRITE_TIMEOUT_MS는 0보다 커야 합니다");
  }
  if (config.resume_token_ttl_ms == 0) {
    throw std::invalid_argument("RESUME_TOKEN_TTL_MS는 0보다 커야 합니다");
  }
  if (config.sweep_interval_ms == 0) {
    throw std::invalid_argument("SWEEP_INTERVAL_MS는 0보다 커야 합니다");
  }
  // idle 타임아웃은 sweep 주기보다 길어야 한다.
  if (config.idle_timeout_ms <= config.sweep_interval_ms) {
    throw std::invalid_argument("IDLE_TIMEOUT_MS는 SWEEP_INTERVAL_MS보다 커야 합니다");
  }
  if (config.player_id_bytes == 0 || config.player_id_bytes > 32) {
    throw std::invalid_argument("PLAYER_ID_BYTES는 1~32 사이여야 합니다");
  }
  if (config.ws_queue_limit_messages == 0 || config.ws_queue_limit_bytes == 0) {
    throw std::invalid_argument("WS 큐 한도는 0보다 커야 합니다");
  }
}

}  // namespace relay
