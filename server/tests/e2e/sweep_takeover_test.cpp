#include <chrono>
#include <string>
#include <thread>

#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "relay/identity.hpp"
#include "support/relay_fixture.hpp"

namespace {

using relay::testing::RelayServerFixture;

class IdleSweepTest : public RelayServerFixture {
 protected:
  relay::AppConfig MakeConfig() override {
    auto config = RelayServerFixture::MakeConfig();
    config.sweep_interval_ms = 100;
    config.idle_timeout_ms = 300;
    return config;
  }
};

TEST_F(IdleSweepTest, SilentClientIsClosedByServer) {
  auto client = Connect();
  auto id = client->ReadAssignedId();

  auto result = client->ReadWithin(std::chrono::seconds(3));
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.ec, boost::beast::websocket::error::closed);

  EXPECT_TRUE(WaitUntil([&] { return !app_->GetRegistry()->FindHandle(id).has_value(); }));
  EXPECT_GE(app_->GetObservability()->Snapshot().evictions, 1u);
}

TEST_F(IdleSweepTest, MovingClientSurvivesSweeps) {
  auto client = Connect();
  auto id = client->ReadAssignedId();

  for (int i = 0; i < 8; ++i) {
    client->SendMove(i, i);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  EXPECT_TRUE(app_->GetRegistry()->FindHandle(id).has_value());
  EXPECT_EQ(app_->GetObservability()->Snapshot().evictions, 0u);
}

class ReadDeadlineTest : public RelayServerFixture {
 protected:
  relay::AppConfig MakeConfig() override {
    auto config = RelayServerFixture::MakeConfig();
    config.ws_read_timeout_ms = 300;
    return config;
  }
};

TEST_F(ReadDeadlineTest, ConnectionIsDroppedWhenNoFrameArrivesInTime) {
  auto client = Connect();
  auto id = client->ReadAssignedId();

  auto result = client->ReadWithin(std::chrono::seconds(3));
  EXPECT_FALSE(result.timed_out);
  EXPECT_TRUE(result.ec);

  EXPECT_TRUE(WaitUntil([&] { return !app_->GetRegistry()->FindHandle(id).has_value(); }));
}

class TakeoverTest : public RelayServerFixture {};

std::string ResumeTarget(const std::string& id, const std::string& token) {
  return "/game?id=" + id + "&token=" + token;
}

TEST_F(TakeoverTest, ReconnectWithSameIdReplacesOldConnection) {
  auto first = Connect();
  auto id = first->ReadAssignedId();
  ASSERT_FALSE(first->ResumeToken().empty());

  auto second = Connect(ResumeTarget(id, first->ResumeToken()));
  EXPECT_EQ(second->ReadAssignedId(), id);
  EXPECT_NE(second->ResumeToken(), first->ResumeToken());

  auto result = first->ReadWithin(std::chrono::seconds(3));
  EXPECT_FALSE(result.timed_out);
  EXPECT_TRUE(result.ec);

  auto registry = app_->GetRegistry();
  EXPECT_TRUE(WaitUntil([&] { return registry->Size() == 1u; }));
  EXPECT_TRUE(registry->FindHandle(id).has_value());
  EXPECT_TRUE(registry->IsConsistent());
  EXPECT_EQ(app_->GetObservability()->Snapshot().takeovers, 1u);

  // 이후 접속자는 해당 식별자를 한 번만 본다.
  auto observer = Connect();
  observer->ReadAssignedId();
  auto existing = observer->ReadJson();
  EXPECT_EQ(existing.value("playerId", ""), id);
  EXPECT_TRUE(observer->ReadWithin(std::chrono::milliseconds(200)).timed_out);
}

TEST_F(TakeoverTest, ResumedConnectionKeepsRelaying) {
  auto first = Connect();
  auto id = first->ReadAssignedId();
  auto peer = Connect();
  peer->ReadAssignedId();
  EXPECT_EQ(peer->ReadJson().value("playerId", ""), id);

  auto second = Connect(ResumeTarget(id, first->ResumeToken()));
  EXPECT_EQ(second->ReadAssignedId(), id);
  second->ReadJson();

  second->SendMove(11, 12);
  auto moved = peer->ReadJson();
  EXPECT_EQ(moved.value("playerId", ""), id);
  EXPECT_DOUBLE_EQ(moved.value("x", 0.0), 11.0);
  EXPECT_DOUBLE_EQ(moved.value("y", 0.0), 12.0);
}

TEST_F(TakeoverTest, PeerCannotClaimBroadcastIdWithoutToken) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();
  auto registry = app_->GetRegistry();
  ASSERT_TRUE(WaitUntil([&] { return registry->FindHandle(alice_id).has_value(); }));
  auto alice_handle = *registry->FindHandle(alice_id);

  // 공격자는 초기 동기화에서 alice의 id를 알게 된다.
  auto mallory = Connect();
  mallory->ReadAssignedId();
  EXPECT_EQ(mallory->ReadJson().value("playerId", ""), alice_id);

  auto without_token = Connect("/game?id=" + alice_id);
  EXPECT_NE(without_token->ReadAssignedId(), alice_id);
  auto guessed_token = Connect(ResumeTarget(alice_id, mallory->ResumeToken()));
  EXPECT_NE(guessed_token->ReadAssignedId(), alice_id);

  EXPECT_EQ(app_->GetObservability()->Snapshot().takeovers, 0u);
  EXPECT_EQ(registry->Size(), 4u);
  ASSERT_TRUE(registry->FindHandle(alice_id).has_value());
  EXPECT_EQ(*registry->FindHandle(alice_id), alice_handle);

  // alice의 연결은 살아 있고 그 id의 이동은 alice만 만든다.
  alice->SendMove(3, 4);
  auto moved = mallory->ReadJson();
  EXPECT_EQ(moved.value("playerId", ""), alice_id);
  EXPECT_DOUBLE_EQ(moved.value("x", 0.0), 3.0);
  EXPECT_TRUE(alice->ReadWithin(std::chrono::milliseconds(200)).timed_out);
}

TEST_F(TakeoverTest, MalformedResumeIdFallsBackToFreshIdentity) {
  auto client = Connect("/game?id=NOT-HEX");
  auto id = client->ReadAssignedId();

  EXPECT_NE(id, "NOT-HEX");
  EXPECT_TRUE(relay::IdentityGenerator::IsWellFormed(id));
  EXPECT_EQ(app_->GetObservability()->Snapshot().takeovers, 0u);
}

class ResumeDisabledTest : public RelayServerFixture {
 protected:
  relay::AppConfig MakeConfig() override {
    auto config = RelayServerFixture::MakeConfig();
    config.allow_identity_resume = false;
    return config;
  }
};

TEST_F(ResumeDisabledTest, RequestedIdIsIgnored) {
  auto first = Connect();
  auto id = first->ReadAssignedId();
  EXPECT_TRUE(first->ResumeToken().empty());

  auto second = Connect(ResumeTarget(id, "00"));
  EXPECT_NE(second->ReadAssignedId(), id);
  EXPECT_EQ(app_->GetRegistry()->Size(), 2u);
}

}  // namespace
