/*
 * 설명: JSON 응답 엔벨로프와 리더보드 페이지/이력/스냅샷/메트릭 응답 본문을 생성한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "leaderboard/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace leaderboard {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

nlohmann::json ScopeFields(const ScopeParams& params) {
  nlohmann::json fields = nlohmann::json::object();
  if (params.tournament_id) {
    fields["tournamentId"] = *params.tournament_id;
  }
  if (params.season_id) {
    fields["seasonId"] = *params.season_id;
  }
  if (params.game_code) {
    fields["gameCode"] = *params.game_code;
  }
  return fields;
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json PageToJson(const LeaderboardPage& page) {
  nlohmann::json entries = nlohmann::json::array();
  for (const auto& entry : page.entries) {
    entries.push_back(EntryToJson(entry));
  }
  nlohmann::json metadata = ScopeFields(page.params);
  metadata["count"] = page.metadata.count;
  metadata["total"] = page.total;
  metadata["cacheHit"] = page.metadata.cache_hit;
  metadata["computationEnabled"] = page.metadata.computation_enabled;
  if (page.metadata.cached_at) {
    metadata["cachedAt"] = *page.metadata.cached_at;
  }
  if (page.metadata.queried_at) {
    metadata["queriedAt"] = *page.metadata.queried_at;
  }
  return nlohmann::json{{"scope", ScopeName(page.params.scope)}, {"entries", entries}, {"metadata", metadata}};
}

nlohmann::json PlayerHistoryToJson(const PlayerHistory& history) {
  nlohmann::json points = nlohmann::json::array();
  for (const auto& point : history.history) {
    points.push_back(HistoryPointToJson(point));
  }
  nlohmann::json body = ScopeFields(history.params);
  body["playerId"] = history.player_id;
  body["scope"] = ScopeName(history.params.scope);
  body["history"] = points;
  body["count"] = history.history.size();
  body["cacheHit"] = history.cache_hit;
  body["computationEnabled"] = history.computation_enabled;
  return body;
}

nlohmann::json SnapshotReportToJson(const SnapshotReport& report) {
  nlohmann::json deltas = nlohmann::json::array();
  for (const auto& delta : report.deltas) {
    deltas.push_back(DeltaToJson(delta));
  }
  nlohmann::json body = ScopeFields(report.params);
  body["scope"] = ScopeName(report.params.scope);
  body["date"] = report.date;
  body["rowsWritten"] = report.rows_written;
  body["durationMs"] = report.duration_ms;
  body["deltas"] = deltas;
  body["error"] = report.error ? nlohmann::json(*report.error) : nlohmann::json();
  return body;
}

nlohmann::json MetricsToJson(const MetricsSnapshot& metrics) {
  return nlohmann::json{{"requestTotal", metrics.request_total},   {"requestErrors", metrics.request_errors},
                        {"cacheHits", metrics.cache_hits},         {"cacheMisses", metrics.cache_misses},
                        {"cacheErrors", metrics.cache_errors},     {"computations", metrics.computations},
                        {"snapshotRuns", metrics.snapshot_runs},   {"snapshotRows", metrics.snapshot_rows}};
}

}  // namespace leaderboard
