#pragma once

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "leaderboard/cache_backend.hpp"
#include "leaderboard/db_client.hpp"
#include "leaderboard/leaderboard_types.hpp"
#include "leaderboard/memory_cache_backend.hpp"
#include "leaderboard/record_store.hpp"
#include "leaderboard/snapshot_store.hpp"

namespace leaderboard {
namespace testing_support {

inline std::chrono::system_clock::time_point At(const std::string& iso) { return ParseIsoString(iso); }

class FakeRecordStore : public RecordStore {
 public:
  void AddTournament(TournamentInfo info) {
    std::lock_guard<std::mutex> lock(mutex_);
    tournaments_[info.tournament_id] = std::move(info);
  }
  void AddPlacement(std::int64_t tournament_id, PlacementRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    placements_[tournament_id].push_back(std::move(record));
  }
  void AddOutcome(std::int64_t tournament_id, MatchOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_[tournament_id].push_back(outcome);
  }
  void AddStanding(const ScopeParams& params, StandingRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    standings_[RawScopeKey(params)].push_back(std::move(record));
  }
  void ClearStandings(const ScopeParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    standings_.erase(RawScopeKey(params));
  }
  void SetFailing(bool failing) { failing_ = failing; }
  int FetchCount() const { return fetch_count_.load(); }

  std::optional<TournamentInfo> FetchTournament(std::int64_t tournament_id) override {
    Touch();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tournaments_.find(tournament_id);
    if (it == tournaments_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<PlacementRecord> FetchPlacements(std::int64_t tournament_id) override {
    Touch();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = placements_.find(tournament_id);
    return it == placements_.end() ? std::vector<PlacementRecord>{} : it->second;
  }

  std::vector<MatchOutcome> FetchMatchOutcomes(std::int64_t tournament_id) override {
    Touch();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outcomes_.find(tournament_id);
    return it == outcomes_.end() ? std::vector<MatchOutcome>{} : it->second;
  }

  std::vector<StandingRecord> FetchStandings(const ScopeParams& params) override {
    Touch();
    std::lock_guard<std::mutex> lock(mutex_);
    // 실제 저장소처럼 game_code 원문으로 거른다. "ALL"은 별도 게임으로 취급된다.
    auto it = standings_.find(RawScopeKey(params));
    return it == standings_.end() ? std::vector<StandingRecord>{} : it->second;
  }

  std::vector<std::int64_t> FetchActiveTournamentIds() override {
    Touch();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::int64_t> ids;
    for (const auto& [id, info] : tournaments_) {
      if (info.in_progress) {
        ids.push_back(id);
      }
    }
    return ids;
  }

 private:
  static std::string RawScopeKey(const ScopeParams& params) {
    return ScopeName(params.scope) + "|" + std::to_string(params.tournament_id.value_or(0)) + "|" +
           params.season_id.value_or("") + "|" + params.game_code.value_or("");
  }

  void Touch() {
    fetch_count_.fetch_add(1);
    if (failing_.load()) {
      throw DbException("기록 저장소 연결 실패", 2013, true);
    }
  }

  std::mutex mutex_;
  std::map<std::int64_t, TournamentInfo> tournaments_;
  std::map<std::int64_t, std::vector<PlacementRecord>> placements_;
  std::map<std::int64_t, std::vector<MatchOutcome>> outcomes_;
  std::map<std::string, std::vector<StandingRecord>> standings_;
  std::atomic<bool> failing_{false};
  std::atomic<int> fetch_count_{0};
};

class FakeSnapshotStore : public SnapshotStore {
 public:
  std::size_t Upsert(const std::vector<SnapshotRow>& rows) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& row : rows) {
      rows_[KeyOf(row)] = row;
    }
    ++upsert_calls_;
    return rows.size();
  }

  std::vector<HistoryPoint> History(std::int64_t player_id, const ScopeParams& params,
                                    const std::optional<std::string>& since_date) override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++history_calls_;
    std::map<std::string, HistoryPoint> by_date;
    for (const auto& [key, row] : rows_) {
      if (!row.player_id || *row.player_id != player_id || ScopeKey(row.params) != ScopeKey(params)) {
        continue;
      }
      if (since_date && row.date < *since_date) {
        continue;
      }
      by_date[row.date] = HistoryPoint{row.date, row.rank, row.points, ScopeName(row.params.scope)};
    }
    std::vector<HistoryPoint> out;
    for (const auto& [date, point] : by_date) {
      out.push_back(point);
    }
    return out;
  }

  std::vector<SnapshotRow> LatestBefore(const ScopeParams& params, const std::string& date) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string latest;
    for (const auto& [key, row] : rows_) {
      if (ScopeKey(row.params) == ScopeKey(params) && row.date < date && row.date > latest) {
        latest = row.date;
      }
    }
    return latest.empty() ? std::vector<SnapshotRow>{} : RowsForDateLocked(params, latest);
  }

  std::optional<std::string> LatestDate(const ScopeParams& params) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<std::string> latest;
    for (const auto& [key, row] : rows_) {
      if (ScopeKey(row.params) == ScopeKey(params) && (!latest || row.date > *latest)) {
        latest = row.date;
      }
    }
    return latest;
  }

  std::vector<SnapshotRow> RowsForDate(const ScopeParams& params, const std::string& date) override {
    std::lock_guard<std::mutex> lock(mutex_);
    return RowsForDateLocked(params, date);
  }

  std::size_t PruneBefore(const std::string& cutoff_date) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = rows_.begin(); it != rows_.end();) {
      if (it->second.date < cutoff_date) {
        it = rows_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  // 날짜가 섞인 행을 직접 넣어 이력 정렬을 검증할 때 사용한다.
  void Insert(const SnapshotRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);
    rows_[KeyOf(row)] = row;
  }

  std::size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
  }
  int HistoryCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_calls_;
  }

 private:
  using Key = std::tuple<std::string, std::string, std::int64_t, std::int64_t>;

  static Key KeyOf(const SnapshotRow& row) {
    return {row.date, ScopeKey(row.params), row.player_id.value_or(0), row.team_id.value_or(0)};
  }

  std::vector<SnapshotRow> RowsForDateLocked(const ScopeParams& params, const std::string& date) const {
    std::vector<SnapshotRow> out;
    for (const auto& [key, row] : rows_) {
      if (row.date == date && ScopeKey(row.params) == ScopeKey(params)) {
        out.push_back(row);
      }
    }
    std::sort(out.begin(), out.end(), [](const SnapshotRow& a, const SnapshotRow& b) { return a.rank < b.rank; });
    return out;
  }

  mutable std::mutex mutex_;
  std::map<Key, SnapshotRow> rows_;
  int upsert_calls_{0};
  int history_calls_{0};
};

// 호출 횟수를 세고 실제 저장은 MemoryCacheBackend에 위임한다.
class SpyCacheBackend : public CacheBackend {
 public:
  std::optional<std::string> Get(const std::string& key, std::chrono::milliseconds timeout) override {
    gets_.fetch_add(1);
    return inner_.Get(key, timeout);
  }
  void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl,
           std::chrono::milliseconds timeout) override {
    sets_.fetch_add(1);
    inner_.Set(key, value, ttl, timeout);
  }
  void Delete(const std::string& key, std::chrono::milliseconds timeout) override {
    deletes_.fetch_add(1);
    inner_.Delete(key, timeout);
  }

  int Gets() const { return gets_.load(); }
  int Sets() const { return sets_.load(); }
  int Deletes() const { return deletes_.load(); }
  int Calls() const { return Gets() + Sets() + Deletes(); }
  MemoryCacheBackend& Inner() { return inner_; }

 private:
  MemoryCacheBackend inner_{100};
  std::atomic<int> gets_{0};
  std::atomic<int> sets_{0};
  std::atomic<int> deletes_{0};
};

inline PlacementRecord Placement(std::optional<std::int64_t> player_id, std::optional<std::int64_t> team_id,
                                 int placement, const std::string& registered_at) {
  PlacementRecord record;
  record.player_id = player_id;
  record.team_id = team_id;
  record.placement = placement;
  record.registered_at = At(registered_at);
  record.last_updated = At("2025-06-01T12:00:00Z");
  return record;
}

inline StandingRecord Standing(std::int64_t player_id, int points, int wins, int losses,
                               const std::string& registered_at) {
  StandingRecord record;
  record.player_id = player_id;
  record.points = points;
  record.wins = wins;
  record.losses = losses;
  record.registered_at = At(registered_at);
  record.last_updated = At("2025-06-01T12:00:00Z");
  return record;
}

// 8팀 예시: A 1위 5승, B 2위 2승, C-F 2~3위 0승(등록 시각으로만 구분), G/H 4위 이하.
inline void SeedEightTeamTournament(FakeRecordStore& store, std::int64_t tournament_id) {
  store.AddTournament(TournamentInfo{tournament_id, "valorant", "single_elimination", true});
  store.AddPlacement(tournament_id, Placement(std::nullopt, 101, 1, "2025-05-01T09:00:00Z"));  // A
  store.AddPlacement(tournament_id, Placement(std::nullopt, 102, 2, "2025-05-01T09:05:00Z"));  // B
  store.AddPlacement(tournament_id, Placement(std::nullopt, 106, 2, "2025-05-01T09:01:00Z"));  // F
  store.AddPlacement(tournament_id, Placement(std::nullopt, 103, 2, "2025-05-01T09:03:00Z"));  // C
  store.AddPlacement(tournament_id, Placement(std::nullopt, 105, 3, "2025-05-01T09:02:00Z"));  // E
  store.AddPlacement(tournament_id, Placement(std::nullopt, 104, 3, "2025-05-01T09:04:00Z"));  // D
  store.AddPlacement(tournament_id, Placement(std::nullopt, 107, 5, "2025-05-01T09:06:00Z"));  // G
  store.AddPlacement(tournament_id, Placement(std::nullopt, 108, 5, "2025-05-01T09:07:00Z"));  // H
  for (int i = 0; i < 5; ++i) {
    store.AddOutcome(tournament_id, MatchOutcome{std::nullopt, 101, std::nullopt, 102 + (i % 4)});
  }
  for (int i = 0; i < 2; ++i) {
    store.AddOutcome(tournament_id, MatchOutcome{std::nullopt, 102, std::nullopt, 107 + i});
  }
}

}  // namespace testing_support
}  // namespace leaderboard
