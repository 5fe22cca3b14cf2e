/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace relay {

struct AppConfig {
  unsigned short port{8080};
  unsigned int worker_threads{0};
  std::string log_level{"info"};
  std::size_t ws_handshake_timeout_ms{30000};
  std::size_t ws_read_timeout_ms{120000};
  std::size_t ws_write_timeout_ms{5000};
  std::size_t ws_queue_limit_messages{256};
  std::size_t ws_queue_limit_bytes{1048576};
  std::size_t sweep_interval_ms{10000};
  std::size_t idle_timeout_ms{30000};
  std::size_t player_id_bytes{8};
  bool allow_identity_resume{true};
  std::size_t resume_token_ttl_ms{300000};
};

// 값이 숫자가 아니거나, 타임아웃이 0이거나, idle 타임아웃이 sweep 주기보다 짧으면 std::invalid_argument를 던진다.
AppConfig LoadConfigFromEnv();
void ValidateConfig(const AppConfig& config);

}  // namespace relay
