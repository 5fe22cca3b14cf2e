#include <chrono>
#include <optional>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "relay/protocol.hpp"

TEST(ProtocolTest, EncodesInitialRecordWithoutLastSeen) {
  relay::PlayerRecord record{"abcd", 0.0, 0.0, std::chrono::steady_clock::now()};
  auto json = nlohmann::json::parse(relay::EncodePlayerRecord(record));
  EXPECT_EQ(json, (nlohmann::json{{"id", "abcd"}, {"x", 0.0}, {"y", 0.0}}));
}

TEST(ProtocolTest, WelcomeCarriesResumeTokenOnlyWhenIssued) {
  relay::PlayerRecord record{"abcd", 0.0, 0.0, std::chrono::steady_clock::now()};
  auto with_token = nlohmann::json::parse(relay::EncodeWelcome(record, std::string("00ff")));
  EXPECT_EQ(with_token["id"], "abcd");
  EXPECT_EQ(with_token["resumeToken"], "00ff");

  auto without_token = nlohmann::json::parse(relay::EncodeWelcome(record, std::nullopt));
  EXPECT_FALSE(without_token.contains("resumeToken"));
}

TEST(ProtocolTest, EncodesMoveEvent) {
  relay::MoveEvent event;
  event.player_id = "p1";
  event.x = 1.25;
  event.y = -3.5;
  auto json = nlohmann::json::parse(relay::EncodeMoveEvent(event));
  EXPECT_EQ(json["type"], "move");
  EXPECT_EQ(json["playerId"], "p1");
  EXPECT_DOUBLE_EQ(json["x"].get<double>(), 1.25);
  EXPECT_DOUBLE_EQ(json["y"].get<double>(), -3.5);
}

TEST(ProtocolTest, DecodesMoveMessage) {
  std::string error;
  auto event = relay::DecodeClientMessage(R"({"type":"move","playerId":"zz","x":3,"y":4.5})", error);
  ASSERT_TRUE(event.has_value()) << error;
  EXPECT_EQ(event->type, "move");
  EXPECT_EQ(event->player_id, "zz");
  EXPECT_DOUBLE_EQ(event->x, 3.0);
  EXPECT_DOUBLE_EQ(event->y, 4.5);
}

TEST(ProtocolTest, MissingFieldsDefault) {
  std::string error;
  auto event = relay::DecodeClientMessage(R"({"type":"move"})", error);
  ASSERT_TRUE(event.has_value()) << error;
  EXPECT_TRUE(event->player_id.empty());
  EXPECT_DOUBLE_EQ(event->x, 0.0);
  EXPECT_DOUBLE_EQ(event->y, 0.0);

  auto untyped = relay::DecodeClientMessage("{}", error);
  ASSERT_TRUE(untyped.has_value());
  EXPECT_TRUE(untyped->type.empty());
}

TEST(ProtocolTest, KeepsUnknownTypeForCaller) {
  std::string error;
  auto event = relay::DecodeClientMessage(R"({"type":"chat","x":1})", error);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, "chat");
}

TEST(ProtocolTest, RejectsMalformedPayloads) {
  std::string error;
  EXPECT_FALSE(relay::DecodeClientMessage("{not json", error).has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_FALSE(relay::DecodeClientMessage("[1,2,3]", error).has_value());
  EXPECT_FALSE(error.empty());

  EXPECT_FALSE(relay::DecodeClientMessage(R"({"type":"move","x":"1"})", error).has_value());
  EXPECT_FALSE(relay::DecodeClientMessage(R"({"type":7})", error).has_value());
  EXPECT_FALSE(relay::DecodeClientMessage(R"({"type":"move","playerId":42})", error).has_value());
}
