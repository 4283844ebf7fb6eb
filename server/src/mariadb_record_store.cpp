/*
 * 설명: MariaDB 기록 테이블에서 참가 순위, 경기 결과, 누적 집계를 읽어온다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 */
#include "leaderboard/mariadb_record_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace leaderboard {
namespace {
std::optional<std::int64_t> ToId(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  return std::stoll(*value);
}

int ToInt(const std::optional<std::string>& value) { return value ? std::stoi(*value) : 0; }

bool ToBool(const std::optional<std::string>& value) { return value && *value != "0"; }

// "YYYY-MM-DD HH:MM:SS[.ffffff]" (UTC)
std::chrono::system_clock::time_point ToTimePoint(const std::optional<std::string>& value) {
  if (!value || value->size() < 19) {
    return std::chrono::system_clock::time_point{};
  }
  std::tm tm{};
  std::istringstream iss(value->substr(0, 19));
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  if (value->size() > 20 && (*value)[19] == '.') {
    std::string fraction = value->substr(20, 6);
    fraction.resize(6, '0');
    tp += std::chrono::microseconds(std::stoll(fraction));
  }
  return tp;
}
}  // namespace

MariaDbRecordStore::MariaDbRecordStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::optional<TournamentInfo> MariaDbRecordStore::FetchTournament(std::int64_t tournament_id) {
  std::optional<TournamentInfo> info;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT id, game_code, format, status FROM tournaments WHERE id=" << tournament_id << ";";
    auto rows = db_client_->QueryRows(conn, sql.str(), "토너먼트 조회 실패");
    if (rows.empty()) {
      return;
    }
    const auto& row = rows.front();
    info = TournamentInfo{tournament_id, row[1].value_or(""), row[2].value_or(""), row[3].value_or("") == "live"};
  });
  return info;
}

std::vector<PlacementRecord> MariaDbRecordStore::FetchPlacements(std::int64_t tournament_id) {
  std::vector<PlacementRecord> records;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT r.player_id, r.team_id, r.placement, r.created_at, r.updated_at, r.status = 'confirmed', "
           "(r.player_id IS NOT NULL AND (u.id IS NULL OR u.deleted_at IS NOT NULL)) OR "
           "(r.team_id IS NOT NULL AND (t.id IS NULL OR t.deleted_at IS NOT NULL)) "
           "FROM registrations r LEFT JOIN users u ON u.id = r.player_id LEFT JOIN teams t ON t.id = r.team_id "
           "WHERE r.tournament_id="
        << tournament_id << " AND r.placement IS NOT NULL;";
    auto rows = db_client_->QueryRows(conn, sql.str(), "참가 순위 조회 실패");
    records.clear();
    records.reserve(rows.size());
    for (const auto& row : rows) {
      PlacementRecord record;
      record.player_id = ToId(row[0]);
      record.team_id = ToId(row[1]);
      record.placement = ToInt(row[2]);
      record.registered_at = ToTimePoint(row[3]);
      record.last_updated = ToTimePoint(row[4]);
      record.is_active = ToBool(row[5]);
      record.subject_deleted = ToBool(row[6]);
      records.push_back(record);
    }
  });
  return records;
}

std::vector<MatchOutcome> MariaDbRecordStore::FetchMatchOutcomes(std::int64_t tournament_id) {
  std::vector<MatchOutcome> outcomes;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT winner_player_id, winner_team_id, loser_player_id, loser_team_id FROM matches WHERE tournament_id="
        << tournament_id << " AND state = 'completed';";
    auto rows = db_client_->QueryRows(conn, sql.str(), "경기 결과 조회 실패");
    outcomes.clear();
    outcomes.reserve(rows.size());
    for (const auto& row : rows) {
      outcomes.push_back(MatchOutcome{ToId(row[0]), ToId(row[1]), ToId(row[2]), ToId(row[3])});
    }
  });
  return outcomes;
}

std::vector<StandingRecord> MariaDbRecordStore::FetchStandings(const ScopeParams& params) {
  ValidateScopeParams(params);
  std::vector<StandingRecord> records;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT s.player_id, s.team_id, s.points, s.wins, s.losses, s.registered_at, s.updated_at, s.is_active, "
           "(s.player_id IS NOT NULL AND (u.id IS NULL OR u.deleted_at IS NOT NULL)) OR "
           "(s.team_id IS NOT NULL AND (t.id IS NULL OR t.deleted_at IS NOT NULL)) "
           "FROM leaderboard_standings s LEFT JOIN users u ON u.id = s.player_id LEFT JOIN teams t ON t.id = s.team_id "
           "WHERE s.scope='"
        << ScopeName(params.scope) << "' AND s.game_code='" << db_client_->Escape(conn, params.game_code.value_or(""))
        << "'";
    if (params.scope == Scope::kSeason) {
      sql << " AND s.season_id='" << db_client_->Escape(conn, *params.season_id) << "'";
    }
    sql << ";";
    auto rows = db_client_->QueryRows(conn, sql.str(), "누적 순위 조회 실패");
    records.clear();
    records.reserve(rows.size());
    for (const auto& row : rows) {
      StandingRecord record;
      record.player_id = ToId(row[0]);
      record.team_id = ToId(row[1]);
      record.points = ToInt(row[2]);
      record.wins = ToInt(row[3]);
      record.losses = ToInt(row[4]);
      record.registered_at = ToTimePoint(row[5]);
      record.last_updated = ToTimePoint(row[6]);
      record.is_active = ToBool(row[7]);
      record.subject_deleted = ToBool(row[8]);
      records.push_back(record);
    }
  });
  return records;
}

std::vector<std::int64_t> MariaDbRecordStore::FetchActiveTournamentIds() {
  std::vector<std::int64_t> ids;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto rows = db_client_->QueryRows(conn, "SELECT id FROM tournaments WHERE status = 'live' ORDER BY id;",
                                      "진행 중 토너먼트 조회 실패");
    ids.clear();
    for (const auto& row : rows) {
      if (auto id = ToId(row[0])) {
        ids.push_back(*id);
      }
    }
  });
  return ids;
}

}  // namespace leaderboard
