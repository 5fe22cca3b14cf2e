#include <chrono>
#include <cstdint>
#include <set>
#include <string>

#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "relay/identity.hpp"
#include "support/relay_fixture.hpp"

namespace {

using relay::testing::RelayServerFixture;

void ExpectMove(const nlohmann::json& message, const std::string& player_id, double x, double y) {
  ASSERT_TRUE(message.is_object());
  EXPECT_EQ(message.value("type", ""), "move");
  EXPECT_EQ(message.value("playerId", ""), player_id);
  EXPECT_DOUBLE_EQ(message.value("x", -1.0), x);
  EXPECT_DOUBLE_EQ(message.value("y", -1.0), y);
}

class RelayFlowTest : public RelayServerFixture {};

TEST_F(RelayFlowTest, FirstMessageIsOwnRecordAtOrigin) {
  auto client = Connect();
  auto record = client->ReadJson();

  ASSERT_TRUE(record.contains("id"));
  auto id = record["id"].get<std::string>();
  EXPECT_TRUE(relay::IdentityGenerator::IsWellFormed(id));
  EXPECT_EQ(id.size(), config_.player_id_bytes * 2);
  EXPECT_DOUBLE_EQ(record["x"].get<double>(), 0.0);
  EXPECT_DOUBLE_EQ(record["y"].get<double>(), 0.0);
  EXPECT_FALSE(record.contains("type"));

  EXPECT_TRUE(WaitUntil([&] { return app_->GetRegistry()->FindHandle(id).has_value(); }));
}

TEST_F(RelayFlowTest, EachClientSeesOnlyTheOtherClientsMoves) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();

  auto bob = Connect();
  auto bob_id = bob->ReadAssignedId();
  ExpectMove(bob->ReadJson(), alice_id, 0, 0);

  alice->SendMove(1, 2);
  bob->SendMove(3, 4);

  ExpectMove(alice->ReadJson(), bob_id, 3, 4);
  ExpectMove(bob->ReadJson(), alice_id, 1, 2);

  // 자기 이벤트가 되돌아왔다면 상대의 다음 이동보다 먼저 도착한다.
  bob->SendMove(9, 9);
  ExpectMove(alice->ReadJson(), bob_id, 9, 9);
  alice->SendMove(8, 8);
  ExpectMove(bob->ReadJson(), alice_id, 8, 8);

  EXPECT_TRUE(alice->ReadWithin(std::chrono::milliseconds(200)).timed_out);
}

TEST_F(RelayFlowTest, LateJoinerReceivesEveryExistingPlayer) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();
  auto bob = Connect();
  auto bob_id = bob->ReadAssignedId();
  ExpectMove(bob->ReadJson(), alice_id, 0, 0);

  alice->SendMove(5, 6);
  ExpectMove(bob->ReadJson(), alice_id, 5, 6);

  auto carol = Connect();
  auto carol_id = carol->ReadAssignedId();
  EXPECT_NE(carol_id, alice_id);
  EXPECT_NE(carol_id, bob_id);

  std::set<std::string> seen;
  for (int i = 0; i < 2; ++i) {
    auto message = carol->ReadJson();
    ASSERT_EQ(message.value("type", ""), "move");
    auto player_id = message.value("playerId", "");
    seen.insert(player_id);
    if (player_id == alice_id) {
      EXPECT_DOUBLE_EQ(message["x"].get<double>(), 5.0);
      EXPECT_DOUBLE_EQ(message["y"].get<double>(), 6.0);
    } else {
      EXPECT_EQ(player_id, bob_id);
      EXPECT_DOUBLE_EQ(message["x"].get<double>(), 0.0);
      EXPECT_DOUBLE_EQ(message["y"].get<double>(), 0.0);
    }
  }
  EXPECT_EQ(seen, (std::set<std::string>{alice_id, bob_id}));

  // 새 연결은 기존 클라이언트에게 알려지지 않는다.
  EXPECT_TRUE(alice->ReadWithin(std::chrono::milliseconds(200)).timed_out);
}

TEST_F(RelayFlowTest, ClaimedPlayerIdIsReplacedWithSenderIdentity) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();
  auto bob = Connect();
  auto bob_id = bob->ReadAssignedId();
  ExpectMove(bob->ReadJson(), alice_id, 0, 0);

  bob->SendMove(42, 43, alice_id);
  ExpectMove(alice->ReadJson(), bob_id, 42, 43);

  auto registry = app_->GetRegistry();
  auto alice_handle = registry->FindHandle(alice_id);
  ASSERT_TRUE(alice_handle.has_value());
  auto alice_record = registry->Find(*alice_handle);
  ASSERT_TRUE(alice_record.has_value());
  EXPECT_DOUBLE_EQ(alice_record->x, 0.0);
  EXPECT_DOUBLE_EQ(alice_record->y, 0.0);

  auto bob_handle = registry->FindHandle(bob_id);
  ASSERT_TRUE(bob_handle.has_value());
  EXPECT_DOUBLE_EQ(registry->Find(*bob_handle)->x, 42.0);
}

TEST_F(RelayFlowTest, MalformedAndUnknownMessagesDoNotCloseTheConnection) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();
  auto bob = Connect();
  bob->ReadAssignedId();
  ExpectMove(bob->ReadJson(), alice_id, 0, 0);

  alice->SendText("{not json");
  alice->SendText("[1,2]");
  alice->SendJson({{"type", "move"}, {"x", "fast"}});
  alice->SendJson({{"type", "chat"}, {"text", "hi"}});
  alice->SendMove(7, 8);

  ExpectMove(bob->ReadJson(), alice_id, 7, 8);
  EXPECT_EQ(app_->GetRegistry()->Size(), 2u);

  auto metrics = Get("/metrics").Json();
  EXPECT_GE(metrics["data"]["decodeErrors"].get<std::uint64_t>(), 3u);
}

TEST_F(RelayFlowTest, MissingCoordinatesDefaultToZero) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();
  auto bob = Connect();
  bob->ReadAssignedId();
  ExpectMove(bob->ReadJson(), alice_id, 0, 0);

  alice->SendJson({{"type", "move"}, {"x", 5}});
  ExpectMove(bob->ReadJson(), alice_id, 5, 0);
}

TEST_F(RelayFlowTest, DisconnectedPlayerIsRemovedFromRegistry) {
  auto alice = Connect();
  auto alice_id = alice->ReadAssignedId();
  alice.reset();

  EXPECT_TRUE(WaitUntil([&] { return !app_->GetRegistry()->FindHandle(alice_id).has_value(); }));
  EXPECT_TRUE(app_->GetRegistry()->IsConsistent());

  auto bob = Connect();
  bob->ReadAssignedId();
  EXPECT_TRUE(bob->ReadWithin(std::chrono::milliseconds(200)).timed_out);
}

TEST_F(RelayFlowTest, UpgradeOutsideGamePathIsDeclined) {
  EXPECT_THROW(Connect("/lobby"), boost::system::system_error);
  EXPECT_EQ(app_->GetRegistry()->Size(), 0u);
}

}  // namespace
