/*
 * 설명: 스냅샷 행을 ON DUPLICATE KEY UPDATE로 upsert하고 이력/직전 스냅샷을 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/snapshot_upsert_it_test.cpp
 */
#include "leaderboard/mariadb_snapshot_store.hpp"

#include <algorithm>
#include <sstream>

namespace leaderboard {
namespace {
std::int64_t IdOrZero(const std::optional<std::int64_t>& id) { return id ? *id : 0; }

std::optional<std::int64_t> ZeroAsNull(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  auto id = std::stoll(*value);
  return id == 0 ? std::nullopt : std::optional<std::int64_t>(id);
}

int ToInt(const std::optional<std::string>& value) { return value ? std::stoi(*value) : 0; }
}  // namespace

MariaDbSnapshotStore::MariaDbSnapshotStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::string MariaDbSnapshotStore::ScopeFilter(MYSQL* conn, const ScopeParams& params) const {
  std::ostringstream oss;
  oss << "leaderboard_type='" << ScopeName(params.scope) << "' AND scope_ref='"
      << db_client_->Escape(conn, SnapshotScopeRef(params)) << "' AND game_code='"
      << db_client_->Escape(conn, params.game_code.value_or("")) << "'";
  return oss.str();
}

std::size_t MariaDbSnapshotStore::Upsert(const std::vector<SnapshotRow>& rows) {
  if (rows.empty()) {
    return 0;
  }
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    for (std::size_t begin = 0; begin < rows.size(); begin += batch_size_) {
      std::size_t end = std::min(rows.size(), begin + batch_size_);
      std::ostringstream sql;
      sql << "INSERT INTO leaderboard_snapshots(snapshot_date, leaderboard_type, scope_ref, game_code, player_id, "
             "team_id, rank_value, points, updated_at) VALUES ";
      for (std::size_t i = begin; i < end; ++i) {
        const auto& row = rows[i];
        if (i != begin) {
          sql << ", ";
        }
        sql << "('" << db_client_->Escape(conn, row.date) << "', '" << ScopeName(row.params.scope) << "', '"
            << db_client_->Escape(conn, SnapshotScopeRef(row.params)) << "', '"
            << db_client_->Escape(conn, row.params.game_code.value_or("")) << "', " << IdOrZero(row.player_id) << ", "
            << IdOrZero(row.team_id) << ", " << row.rank << ", " << row.points << ", NOW(6))";
      }
      sql << " ON DUPLICATE KEY UPDATE rank_value=VALUES(rank_value), points=VALUES(points), updated_at=NOW(6);";
      db_client_->Execute(conn, sql.str(), "스냅샷 upsert 실패");
    }
    return true;
  });
  return rows.size();
}

std::vector<HistoryPoint> MariaDbSnapshotStore::History(std::int64_t player_id, const ScopeParams& params,
                                                        const std::optional<std::string>& since_date) {
  std::vector<HistoryPoint> history;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT snapshot_date, MIN(rank_value), MAX(points), leaderboard_type FROM leaderboard_snapshots WHERE "
        << ScopeFilter(conn, params) << " AND player_id=" << player_id;
    if (since_date) {
      sql << " AND snapshot_date >= '" << db_client_->Escape(conn, *since_date) << "'";
    }
    sql << " GROUP BY snapshot_date, leaderboard_type ORDER BY snapshot_date ASC;";
    auto rows = db_client_->QueryRows(conn, sql.str(), "스냅샷 이력 조회 실패");
    history.clear();
    for (const auto& row : rows) {
      history.push_back(HistoryPoint{row[0].value_or(""), ToInt(row[1]), ToInt(row[2]), row[3].value_or("")});
    }
  });
  return history;
}

std::vector<SnapshotRow> MariaDbSnapshotStore::SelectRows(MYSQL* conn, const ScopeParams& params,
                                                          const std::string& date) const {
  std::ostringstream sql;
  sql << "SELECT snapshot_date, player_id, team_id, rank_value, points FROM leaderboard_snapshots WHERE "
      << ScopeFilter(conn, params) << " AND snapshot_date='" << db_client_->Escape(conn, date)
      << "' ORDER BY rank_value ASC;";
  auto rows = db_client_->QueryRows(conn, sql.str(), "스냅샷 행 조회 실패");
  std::vector<SnapshotRow> result;
  result.reserve(rows.size());
  for (const auto& row : rows) {
    result.push_back(SnapshotRow{row[0].value_or(""), params, ZeroAsNull(row[1]), ZeroAsNull(row[2]), ToInt(row[3]),
                                 ToInt(row[4])});
  }
  return result;
}

std::vector<SnapshotRow> MariaDbSnapshotStore::LatestBefore(const ScopeParams& params, const std::string& date) {
  std::vector<SnapshotRow> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT MAX(snapshot_date) FROM leaderboard_snapshots WHERE " << ScopeFilter(conn, params)
        << " AND snapshot_date < '" << db_client_->Escape(conn, date) << "';";
    auto rows = db_client_->QueryRows(conn, sql.str(), "직전 스냅샷 일자 조회 실패");
    result.clear();
    if (rows.empty() || !rows.front()[0]) {
      return;
    }
    result = SelectRows(conn, params, *rows.front()[0]);
  });
  return result;
}

std::optional<std::string> MariaDbSnapshotStore::LatestDate(const ScopeParams& params) {
  std::optional<std::string> latest;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "SELECT MAX(snapshot_date) FROM leaderboard_snapshots WHERE " << ScopeFilter(conn, params) << ";";
    auto rows = db_client_->QueryRows(conn, sql.str(), "최근 스냅샷 일자 조회 실패");
    latest.reset();
    if (!rows.empty() && rows.front()[0]) {
      latest = *rows.front()[0];
    }
  });
  return latest;
}

std::vector<SnapshotRow> MariaDbSnapshotStore::RowsForDate(const ScopeParams& params, const std::string& date) {
  std::vector<SnapshotRow> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { result = SelectRows(conn, params, date); });
  return result;
}

std::size_t MariaDbSnapshotStore::PruneBefore(const std::string& cutoff_date) {
  unsigned long long deleted = 0;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream sql;
    sql << "DELETE FROM leaderboard_snapshots WHERE snapshot_date < '" << db_client_->Escape(conn, cutoff_date) << "';";
    deleted = db_client_->Execute(conn, sql.str(), "오래된 스냅샷 삭제 실패");
    return true;
  });
  return static_cast<std::size_t>(deleted);
}

std::size_t MariaDbSnapshotStore::Count() const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto rows = db_client_->QueryRows(conn, "SELECT COUNT(*) FROM leaderboard_snapshots;", "스냅샷 카운트 실패");
    if (!rows.empty() && rows.front()[0]) {
      count = static_cast<std::size_t>(std::stoull(*rows.front()[0]));
    }
  });
  return count;
}

void MariaDbSnapshotStore::ClearAll() const {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) { db_client_->Execute(conn, "DELETE FROM leaderboard_snapshots;", "스냅샷 초기화 실패"); });
}

}  // namespace leaderboard
