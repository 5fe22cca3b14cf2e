/*
 * 설명: 연결마다 부여할 플레이어 식별자를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/identity_generator_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "relay/observability.hpp"

namespace relay {

// OpenSSL RAND_bytes로 buffer를 채운다. 실패하면 false.
bool OpenSslEntropy(unsigned char* buffer, std::size_t len);
std::string HexEncode(const unsigned char* data, std::size_t len);

class IdentityGenerator {
 public:
  // 성공 시 true를 반환하고 buffer를 len 바이트만큼 채운다.
  using EntropySource = std::function<bool(unsigned char* buffer, std::size_t len)>;

  explicit IdentityGenerator(std::size_t id_bytes = 8, std::shared_ptr<Observability> observability = nullptr,
                             EntropySource source = {});

  // 엔트로피 소스가 실패하면 시각 기반 식별자로 대체한다. 예외를 던지지 않는다.
  std::string Generate();

  std::size_t IdBytes() const { return id_bytes_; }

  // 재접속 요청 식별자 검증용: 1~64자의 소문자 16진수.
  static bool IsWellFormed(std::string_view id);

 private:
  std::string FallbackId();

  std::size_t id_bytes_;
  std::shared_ptr<Observability> observability_;
  EntropySource source_;
  std::atomic<std::uint64_t> fallback_counter_{0};
};

}  // namespace relay
