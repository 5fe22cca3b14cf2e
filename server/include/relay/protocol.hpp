/*
 * 설명: 플레이어 레코드와 이동 메시지의 JSON 와이어 포맷을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/protocol_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

inline constexpr std::string_view kMoveType = "move";

struct PlayerRecord {
  std::string id;
  double x{0.0};
  double y{0.0};
  std::chrono::steady_clock::time_point last_seen{};
};

// 수신 시 type은 클라이언트가 보낸 값 그대로 담기며, "move"가 아니면 세션이 무시한다.
struct MoveEvent {
  std::string type{kMoveType};
  std::string player_id;
  double x{0.0};
  double y{0.0};
};

nlohmann::json ToJson(const PlayerRecord& record);
nlohmann::json ToJson(const MoveEvent& event);
std::string EncodePlayerRecord(const PlayerRecord& record);
// 접속 직후 본인에게만 보내는 첫 메시지. 토큰이 있으면 resumeToken 필드를 더한다.
std::string EncodeWelcome(const PlayerRecord& record, const std::optional<std::string>& resume_token);
std::string EncodeMoveEvent(const MoveEvent& event);

// JSON 파싱 실패, 객체가 아닌 값, 필드 타입 불일치는 nullopt와 함께 error_message를 채운다.
// 누락된 필드는 기본값(빈 문자열, 0)으로 둔다.
std::optional<MoveEvent> DecodeClientMessage(std::string_view data, std::string& error_message);

}  // namespace relay
