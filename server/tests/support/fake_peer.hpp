#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "relay/peer_connection.hpp"

namespace relay::testing {

// 보낸 메시지를 기록만 하는 연결. fail_sends가 켜져 있으면 Send가 실패한다.
class FakePeer : public PeerConnection {
 public:
  bool Send(std::string message) override {
    if (fail_sends.load() || closed.load()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(std::move(message));
    return true;
  }

  void Close() override {
    closed.store(true);
    close_calls.fetch_add(1);
  }

  std::vector<std::string> Messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  std::atomic<bool> fail_sends{false};
  std::atomic<bool> closed{false};
  std::atomic<int> close_calls{0};

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
};

}  // namespace relay::testing
