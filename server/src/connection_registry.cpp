/*
 * 설명: 연결↔플레이어 양방향 색인의 추가/갱신/삭제/스윕을 하나의 락 아래에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/e2e/sweep_takeover_test.cpp
 */
#include "relay/connection_registry.hpp"

#include <algorithm>

namespace relay {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

ConnectionHandle ConnectionRegistry::NextHandle() { return ConnectionHandle{next_handle_.fetch_add(1)}; }

void ConnectionRegistry::Add(ConnectionHandle handle, const std::shared_ptr<PeerConnection>& connection,
                             PlayerRecord record) {
  std::weak_ptr<PeerConnection> evicted;
  bool took_over = false;
  std::size_t total = 0;
  const std::string player_id = record.id;
  if (record.last_seen == Clock::time_point{}) {
    record.last_seen = Clock::now();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = conns_.find(record.id);
    if (existing != conns_.end() && existing->second != handle) {
      evicted = EraseLocked(existing->second);
      took_over = true;
    }
    auto previous = players_.find(handle);
    if (previous != players_.end() && previous->second.record.id != record.id) {
      // 같은 연결이 다른 id로 다시 등록되면 이전 id 색인을 먼저 지운다.
      EraseLocked(handle);
    }
    players_[handle] = Entry{std::move(record), connection};
    conns_[player_id] = handle;
    total = players_.size();
    PublishActiveLocked();
  }

  if (took_over) {
    if (auto old = evicted.lock()) {
      old->Close();
    }
    if (observability_) {
      observability_->IncrementTakeover();
      observability_->Log(LogLevel::kInfo, "registry.takeover", {{"playerId", player_id}});
    }
  }
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "registry.added",
                        {{"playerId", player_id}, {"connection", handle.value}, {"totalPlayers", total}});
  }
}

bool ConnectionRegistry::Update(ConnectionHandle handle, double x, double y) {
  std::optional<std::string> player_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(handle);
    if (it != players_.end()) {
      auto& record = it->second.record;
      record.x = x;
      record.y = y;
      record.last_seen = std::max(record.last_seen, Clock::now());
      player_id = record.id;
    }
  }
  if (!observability_) {
    return player_id.has_value();
  }
  if (!player_id) {
    observability_->Log(LogLevel::kWarn, "registry.update_unknown", {{"connection", handle.value}});
    return false;
  }
  if (observability_->Enabled(LogLevel::kDebug)) {
    observability_->Log(LogLevel::kDebug, "registry.updated", {{"playerId", *player_id}, {"x", x}, {"y", y}});
  }
  return true;
}

bool ConnectionRegistry::Delete(ConnectionHandle handle) {
  std::optional<std::string> player_id;
  std::size_t total = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = players_.find(handle);
    if (it != players_.end()) {
      player_id = it->second.record.id;
      EraseLocked(handle);
      total = players_.size();
      PublishActiveLocked();
    }
  }
  if (observability_) {
    if (player_id) {
      observability_->Log(LogLevel::kInfo, "registry.removed",
                          {{"playerId", *player_id}, {"connection", handle.value}, {"totalPlayers", total}});
    } else {
      observability_->Log(LogLevel::kDebug, "registry.delete_unknown", {{"connection", handle.value}});
    }
  }
  return player_id.has_value();
}

std::vector<PlayerRecord> ConnectionRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PlayerRecord> records;
  records.reserve(players_.size());
  for (const auto& [handle, entry] : players_) {
    records.push_back(entry.record);
  }
  return records;
}

void ConnectionRegistry::ForEach(const Visitor& visitor) const {
  // 락이 풀린 뒤에 소멸해야 한다. 연결 소멸자가 Delete를 다시 호출할 수 있다.
  std::vector<std::shared_ptr<PeerConnection>> connections;
  std::lock_guard<std::mutex> lock(mutex_);
  connections.reserve(players_.size());
  for (const auto& [handle, entry] : players_) {
    connections.push_back(entry.connection.lock());
    if (!visitor(handle, entry.record, connections.back())) {
      break;
    }
  }
}

std::size_t ConnectionRegistry::SweepStale(Clock::duration timeout) {
  std::vector<std::pair<std::string, std::weak_ptr<PeerConnection>>> evicted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    std::vector<ConnectionHandle> stale;
    for (const auto& [handle, entry] : players_) {
      if (now - entry.record.last_seen > timeout) {
        stale.push_back(handle);
      }
    }
    for (auto handle : stale) {
      auto id = players_.at(handle).record.id;
      evicted.emplace_back(std::move(id), EraseLocked(handle));
    }
    if (!evicted.empty()) {
      PublishActiveLocked();
    }
  }

  for (auto& [player_id, weak] : evicted) {
    if (auto connection = weak.lock()) {
      connection->Close();
    }
    if (observability_) {
      observability_->Log(LogLevel::kInfo, "registry.evicted_inactive", {{"playerId", player_id}});
    }
  }
  if (observability_ && !evicted.empty()) {
    observability_->AddEvictions(evicted.size());
  }
  return evicted.size();
}

std::size_t ConnectionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_.size();
}

std::optional<PlayerRecord> ConnectionRegistry::Find(ConnectionHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(handle);
  if (it == players_.end()) {
    return std::nullopt;
  }
  return it->second.record;
}

std::optional<ConnectionHandle> ConnectionRegistry::FindHandle(const std::string& player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = conns_.find(player_id);
  if (it == conns_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ConnectionRegistry::IsConsistent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (players_.size() != conns_.size()) {
    return false;
  }
  for (const auto& [player_id, handle] : conns_) {
    auto it = players_.find(handle);
    if (it == players_.end() || it->second.record.id != player_id) {
      return false;
    }
  }
  return true;
}

std::weak_ptr<PeerConnection> ConnectionRegistry::EraseLocked(ConnectionHandle handle) {
  auto it = players_.find(handle);
  if (it == players_.end()) {
    return {};
  }
  auto conn_it = conns_.find(it->second.record.id);
  if (conn_it != conns_.end() && conn_it->second == handle) {
    conns_.erase(conn_it);
  }
  auto connection = it->second.connection;
  players_.erase(it);
  return connection;
}

void ConnectionRegistry::PublishActiveLocked() const {
  if (observability_) {
    observability_->SetWebsocketActive(players_.size());
  }
}

}  // namespace relay
