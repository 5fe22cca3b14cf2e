/*
 * 설명: 성공/오류 응답 엔벨로프를 만든다. meta.timestamp는 밀리초 단위 UTC.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "relay/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace relay {

std::string FormatUtcTimestamp(std::chrono::system_clock::time_point time) {
  auto seconds = std::chrono::system_clock::to_time_t(time);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  return nlohmann::json{{"success", true},
                        {"data", data},
                        {"error", nullptr},
                        {"meta", {{"timestamp", FormatUtcTimestamp(std::chrono::system_clock::now())}}}};
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  return nlohmann::json{{"success", false},
                        {"data", nullptr},
                        {"error", {{"code", code}, {"message", message}, {"detail", detail}}},
                        {"meta", {{"timestamp", FormatUtcTimestamp(std::chrono::system_clock::now())}}}};
}

}  // namespace relay
