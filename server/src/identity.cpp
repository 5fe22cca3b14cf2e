/*
 * 설명: OpenSSL 난수로 플레이어 식별자를 만들고 실패 시 시각 기반 식별자로 대체한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/identity_generator_test.cpp
 */
#include "relay/identity.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/rand.h>

namespace relay {

bool OpenSslEntropy(unsigned char* buffer, std::size_t len) {
  return RAND_bytes(buffer, static_cast<int>(len)) == 1;
}

std::string HexEncode(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

IdentityGenerator::IdentityGenerator(std::size_t id_bytes, std::shared_ptr<Observability> observability,
                                     EntropySource source)
    : id_bytes_(id_bytes == 0 ? 8 : id_bytes), observability_(std::move(observability)),
      source_(source ? std::move(source) : EntropySource(OpenSslEntropy)) {}

std::string IdentityGenerator::Generate() {
  std::vector<unsigned char> buffer(id_bytes_);
  if (!source_(buffer.data(), buffer.size())) {
    auto fallback = FallbackId();
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "identity.entropy_failure", {{"fallbackId", fallback}});
    }
    return fallback;
  }
  return HexEncode(buffer.data(), buffer.size());
}

bool IdentityGenerator::IsWellFormed(std::string_view id) {
  if (id.empty() || id.size() > 64) {
    return false;
  }
  for (char c : id) {
    bool digit = c >= '0' && c <= '9';
    bool lower_hex = c >= 'a' && c <= 'f';
    if (!digit && !lower_hex) {
      return false;
    }
  }
  return true;
}

std::string IdentityGenerator::FallbackId() {
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << static_cast<std::uint64_t>(nanos) << std::setw(4)
      << (fallback_counter_.fetch_add(1) & 0xffff);
  return oss.str();
}

}  // namespace relay
