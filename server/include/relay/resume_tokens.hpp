/*
 * 설명: 식별자 재사용(재접속)에 필요한 비밀 토큰을 발급하고 검증한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/resume_tokens_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "relay/identity.hpp"
#include "relay/observability.hpp"

namespace relay {

// 토큰은 해당 플레이어의 초기 레코드로만 전달된다. 플레이어당 하나만 유효하다.
class ResumeTokenStore {
 public:
  using Clock = std::chrono::steady_clock;

  explicit ResumeTokenStore(std::chrono::milliseconds ttl, std::shared_ptr<Observability> observability = nullptr,
                            IdentityGenerator::EntropySource source = {});

  // 이전 토큰을 대체한다. 엔트로피 소스가 실패하면 발급하지 않는다.
  std::optional<std::string> IssueToken(const std::string& player_id);
  bool Validate(const std::string& player_id, std::string_view token);
  void Revoke(const std::string& player_id);
  std::size_t Size() const;

 private:
  struct Entry {
    std::string token;
    Clock::time_point issued_at;
  };

  void PurgeExpiredLocked(Clock::time_point now);

  std::chrono::milliseconds ttl_;
  std::shared_ptr<Observability> observability_;
  IdentityGenerator::EntropySource source_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> tokens_;
};

}  // namespace relay
