/*
 * 설명: REST 응답 엔벨로프와 리더보드/이력/스냅샷 응답 본문을 생성한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "leaderboard/observability.hpp"
#include "leaderboard/query_service.hpp"
#include "leaderboard/snapshot_service.hpp"

namespace leaderboard {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// {scope, entries, metadata{count, total, cacheHit, computationEnabled, tournamentId|seasonId|gameCode, ...}}
nlohmann::json PageToJson(const LeaderboardPage& page);
// {playerId, scope, history[], count, cacheHit}
nlohmann::json PlayerHistoryToJson(const PlayerHistory& history);
nlohmann::json SnapshotReportToJson(const SnapshotReport& report);
nlohmann::json MetricsToJson(const MetricsSnapshot& metrics);

}  // namespace leaderboard
