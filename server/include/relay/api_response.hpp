/*
 * 설명: HTTP 응답용 JSON 엔벨로프와 UTC 타임스탬프 포맷을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: docs/protocol.md
 * 테스트: server/tests/unit/json_envelope_test.cpp, server/tests/e2e/status_metrics_test.cpp
 */
#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

// 예: 2026-10-19T08:15:02.431Z
std::string FormatUtcTimestamp(std::chrono::system_clock::time_point time);

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
// detail은 요청 경로처럼 호출자가 진단에 쓸 부가 정보. 없으면 null.
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

}  // namespace relay
