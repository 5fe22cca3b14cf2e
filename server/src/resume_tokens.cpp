/*
 * 설명: 재접속 토큰을 OpenSSL 난수로 만들고 만료 시간과 함께 플레이어별로 보관한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/resume_tokens_test.cpp
 */
#include "relay/resume_tokens.hpp"

#include <vector>

#include <openssl/crypto.h>

namespace relay {
namespace {
constexpr std::size_t kTokenBytes = 16;
}  // namespace

ResumeTokenStore::ResumeTokenStore(std::chrono::milliseconds ttl, std::shared_ptr<Observability> observability,
                                   IdentityGenerator::EntropySource source)
    : ttl_(ttl), observability_(std::move(observability)),
      source_(source ? std::move(source) : IdentityGenerator::EntropySource(OpenSslEntropy)) {}

std::optional<std::string> ResumeTokenStore::IssueToken(const std::string& player_id) {
  std::vector<unsigned char> buffer(kTokenBytes);
  if (!source_(buffer.data(), buffer.size())) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "resume.entropy_failure", {{"playerId", player_id}});
    }
    Revoke(player_id);
    return std::nullopt;
  }
  auto token = HexEncode(buffer.data(), buffer.size());
  const auto now = Clock::now();
  std::lock_guard<std::mutex> lock(mutex_);
  PurgeExpiredLocked(now);
  tokens_[player_id] = Entry{token, now};
  return token;
}

bool ResumeTokenStore::Validate(const std::string& player_id, std::string_view token) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(player_id);
  if (it == tokens_.end()) {
    return false;
  }
  if (Clock::now() - it->second.issued_at > ttl_) {
    tokens_.erase(it);
    return false;
  }
  const auto& expected = it->second.token;
  return token.size() == expected.size() && CRYPTO_memcmp(token.data(), expected.data(), expected.size()) == 0;
}

void ResumeTokenStore::Revoke(const std::string& player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_.erase(player_id);
}

std::size_t ResumeTokenStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tokens_.size();
}

void ResumeTokenStore::PurgeExpiredLocked(Clock::time_point now) {
  for (auto it = tokens_.begin(); it != tokens_.end();) {
    if (now - it->second.issued_at > ttl_) {
      it = tokens_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace relay
