/*
 * 설명: 살아있는 연결과 플레이어 레코드의 양방향 색인을 단일 뮤텍스로 관리한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/observability.hpp"
#include "relay/peer_connection.hpp"
#include "relay/protocol.hpp"

namespace relay {

// 연결 하나를 가리키는 불투명 토큰. 재사용되지 않는다.
struct ConnectionHandle {
  std::uint64_t value{0};

  bool operator==(const ConnectionHandle& other) const { return value == other.value; }
  bool operator!=(const ConnectionHandle& other) const { return value != other.value; }
};

struct ConnectionHandleHash {
  std::size_t operator()(const ConnectionHandle& handle) const { return std::hash<std::uint64_t>{}(handle.value); }
};

class ConnectionRegistry {
 public:
  using Clock = std::chrono::steady_clock;
  // false를 반환하면 순회를 멈춘다. 락을 잡은 채 호출되므로 레지스트리를 다시 호출하면 안 된다.
  using Visitor = std::function<bool(ConnectionHandle handle, const PlayerRecord& record,
                                     const std::shared_ptr<PeerConnection>& connection)>;

  explicit ConnectionRegistry(std::shared_ptr<Observability> observability = nullptr);

  ConnectionHandle NextHandle();

  void Add(ConnectionHandle handle, const std::shared_ptr<PeerConnection>& connection, PlayerRecord record);
  // 등록되지 않은 연결이면 경고만 남기고 false를 반환한다.
  bool Update(ConnectionHandle handle, double x, double y);
  bool Delete(ConnectionHandle handle);
  std::vector<PlayerRecord> Snapshot() const;
  void ForEach(const Visitor& visitor) const;
  std::size_t SweepStale(Clock::duration timeout);

  std::size_t Size() const;
  std::optional<PlayerRecord> Find(ConnectionHandle handle) const;
  std::optional<ConnectionHandle> FindHandle(const std::string& player_id) const;
  bool IsConsistent() const;

 private:
  struct Entry {
    PlayerRecord record;
    std::weak_ptr<PeerConnection> connection;
  };

  // mutex_를 잡은 상태에서만 호출한다.
  std::weak_ptr<PeerConnection> EraseLocked(ConnectionHandle handle);
  void PublishActiveLocked() const;

  std::unordered_map<ConnectionHandle, Entry, ConnectionHandleHash> players_;
  std::unordered_map<std::string, ConnectionHandle> conns_;
  mutable std::mutex mutex_;
  std::atomic<std::uint64_t> next_handle_{1};
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
