/*
 * 설명: 스코프, 리더보드 엔트리, 원천 기록, 스냅샷 행 등 엔진 공용 타입을 정의한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_types_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace leaderboard {

enum class Scope { kTournament, kSeason, kAllTime };

std::string ScopeName(Scope scope);
// 알 수 없는 이름이면 ConfigurationError를 던진다.
Scope ParseScope(const std::string& name);

struct ScopeParams {
  Scope scope{Scope::kAllTime};
  std::optional<std::int64_t> tournament_id;
  std::optional<std::string> season_id;
  std::optional<std::string> game_code;

  static ScopeParams Tournament(std::int64_t tournament_id);
  static ScopeParams Season(const std::string& season_id, std::optional<std::string> game_code = std::nullopt);
  static ScopeParams AllTime(std::optional<std::string> game_code = std::nullopt);
};

// 빈 문자열과 예약어 "ALL"은 게임 필터 없음(nullopt)으로 본다.
std::optional<std::string> NormalizeGameCode(const std::optional<std::string>& game_code);
// season에 season_id가 없거나 tournament에 id가 없으면 ConfigurationError.
void ValidateScopeParams(const ScopeParams& params);
// 스냅샷/이력의 스코프 식별 문자열. 예: "tournament:42", "season:2025_S1:ALL", "all_time:valorant"
std::string ScopeKey(const ScopeParams& params);
// "all_time", "season:2025_S1:valorant" 같은 설정 문자열을 해석한다.
ScopeParams ParseScopeSpec(const std::string& scope_text);

// PII 필드(이름, 이메일, 표시명)는 의도적으로 존재하지 않는다.
struct LeaderboardEntry {
  int rank{0};
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> team_id;
  int points{0};
  int wins{0};
  int losses{0};
  double win_rate{0.0};
  bool is_active{true};
  std::chrono::system_clock::time_point last_updated{};
};

double WinRate(int wins, int losses);

struct ResultMetadata {
  std::size_t count{0};
  bool cache_hit{false};
  bool computation_enabled{true};
  std::optional<std::string> cached_at;
  std::optional<std::string> queried_at;
};

struct LeaderboardResult {
  ScopeParams params;
  std::vector<LeaderboardEntry> entries;
  ResultMetadata metadata;
};

// ---- 외부 기록 저장소에서 읽어오는 원천 기록 ----

struct TournamentInfo {
  std::int64_t tournament_id{0};
  std::string game_code;
  std::string format;
  bool in_progress{false};
};

struct PlacementRecord {
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> team_id;
  int placement{0};
  std::chrono::system_clock::time_point registered_at{};
  std::chrono::system_clock::time_point last_updated{};
  bool is_active{true};
  // 팀/플레이어가 삭제된 경우 저장소가 true로 표시한다.
  bool subject_deleted{false};
};

struct MatchOutcome {
  std::optional<std::int64_t> winner_player_id;
  std::optional<std::int64_t> winner_team_id;
  std::optional<std::int64_t> loser_player_id;
  std::optional<std::int64_t> loser_team_id;
};

struct StandingRecord {
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> team_id;
  int points{0};
  int wins{0};
  int losses{0};
  std::chrono::system_clock::time_point registered_at{};
  std::chrono::system_clock::time_point last_updated{};
  bool is_active{true};
  bool subject_deleted{false};
};

// ---- 스냅샷 ----

struct SnapshotRow {
  std::string date;  // YYYY-MM-DD (UTC)
  ScopeParams params;
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> team_id;
  int rank{0};
  int points{0};
};

struct HistoryPoint {
  std::string date;
  int rank{0};
  int points{0};
  std::string leaderboard_type;
};

struct RankDelta {
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> team_id;
  std::optional<int> previous_rank;
  int current_rank{0};
  // 음수면 순위 상승, 양수면 하락
  int rank_change{0};
  int points{0};
};

// ---- 직렬화 ----

std::string ToIsoString(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point ParseIsoString(const std::string& text);
std::string ToDateString(std::chrono::system_clock::time_point tp);
std::string ShiftDate(const std::string& date, int days);

nlohmann::json EntryToJson(const LeaderboardEntry& entry);
LeaderboardEntry EntryFromJson(const nlohmann::json& json);
nlohmann::json HistoryPointToJson(const HistoryPoint& point);
HistoryPoint HistoryPointFromJson(const nlohmann::json& json);
nlohmann::json DeltaToJson(const RankDelta& delta);

}  // namespace leaderboard
