/*
 * 설명: 플레이어 레코드/이동 이벤트를 JSON으로 직렬화하고 클라이언트 메시지를 해석한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#include "relay/protocol.hpp"

namespace relay {

nlohmann::json ToJson(const PlayerRecord& record) {
  return {{"id", record.id}, {"x", record.x}, {"y", record.y}};
}

nlohmann::json ToJson(const MoveEvent& event) {
  return {{"type", event.type}, {"playerId", event.player_id}, {"x", event.x}, {"y", event.y}};
}

std::string EncodePlayerRecord(const PlayerRecord& record) { return ToJson(record).dump(); }

std::string EncodeWelcome(const PlayerRecord& record, const std::optional<std::string>& resume_token) {
  auto json = ToJson(record);
  if (resume_token) {
    json["resumeToken"] = *resume_token;
  }
  return json.dump();
}

std::string EncodeMoveEvent(const MoveEvent& event) { return ToJson(event).dump(); }

std::optional<MoveEvent> DecodeClientMessage(std::string_view data, std::string& error_message) {
  auto message = nlohmann::json::parse(data.begin(), data.end(), nullptr, false);
  if (message.is_discarded()) {
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!message.is_object()) {
    error_message = "메시지는 JSON 객체여야 합니다";
    return std::nullopt;
  }

  MoveEvent event;
  event.type.clear();
  auto type_it = message.find("type");
  if (type_it != message.end() && !type_it->is_null()) {
    if (!type_it->is_string()) {
      error_message = "type 필드는 문자열이어야 합니다";
      return std::nullopt;
    }
    event.type = type_it->get<std::string>();
  }
  auto player_it = message.find("playerId");
  if (player_it != message.end() && !player_it->is_null()) {
    if (!player_it->is_string()) {
      error_message = "playerId 필드는 문자열이어야 합니다";
      return std::nullopt;
    }
    event.player_id = player_it->get<std::string>();
  }
  auto x_it = message.find("x");
  if (x_it != message.end() && !x_it->is_null()) {
    if (!x_it->is_number()) {
      error_message = "x 필드는 숫자여야 합니다";
      return std::nullopt;
    }
    event.x = x_it->get<double>();
  }
  auto y_it = message.find("y");
  if (y_it != message.end() && !y_it->is_null()) {
    if (!y_it->is_number()) {
      error_message = "y 필드는 숫자여야 합니다";
      return std::nullopt;
    }
    event.y = y_it->get<double>();
  }
  return event;
}

}  // namespace relay
