/*
 * 설명: 일자별 순위 스냅샷 생성, 순위 변화 계산, 이력 캐시 무효화, 보존 기간 정리를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/snapshot_service_test.cpp
 */
#include "leaderboard/snapshot_service.hpp"

#include <map>
#include <utility>

#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
using SubjectKey = std::pair<std::int64_t, std::int64_t>;

SubjectKey KeyOf(const std::optional<std::int64_t>& player_id, const std::optional<std::int64_t>& team_id) {
  return {player_id.value_or(0), team_id.value_or(0)};
}

// 식별자가 빠진 스코프는 RunScope에서 스코프 단위 오류로 보고된다.
bool HasScopeIdentity(const ScopeParams& params) {
  switch (params.scope) {
    case Scope::kTournament:
      return params.tournament_id.has_value();
    case Scope::kSeason:
      return params.season_id && !params.season_id->empty();
    case Scope::kAllTime:
      return true;
  }
  return false;
}
}  // namespace

SnapshotService::SnapshotService(std::shared_ptr<LeaderboardComputer> computer,
                                 std::shared_ptr<SnapshotStore> snapshots, std::shared_ptr<RecordStore> records,
                                 std::shared_ptr<CacheLayer> cache, SnapshotServiceOptions options,
                                 std::shared_ptr<Observability> observability)
    : computer_(std::move(computer)),
      snapshots_(std::move(snapshots)),
      records_(std::move(records)),
      cache_(std::move(cache)),
      options_(std::move(options)),
      observability_(std::move(observability)) {}

std::vector<ScopeParams> SnapshotService::TrackedScopes() {
  auto scopes = options_.tracked_scopes;
  for (auto id : records_->FetchActiveTournamentIds()) {
    scopes.push_back(ScopeParams::Tournament(id));
  }
  return scopes;
}

std::vector<SnapshotReport> SnapshotService::Run(const std::string& date) { return Run(date, TrackedScopes()); }

std::vector<SnapshotReport> SnapshotService::Run(const std::string& date, const std::vector<ScopeParams>& scopes) {
  std::lock_guard<std::mutex> lock(run_mutex_);
  std::vector<SnapshotReport> reports;
  if (cache_ && !cache_->Flags().compute_enabled) {
    if (observability_) {
      LogContext ctx;
      ctx.name = "leaderboard.snapshot.skipped";
      ctx.fields = {{"date", date}, {"reason", "computation_disabled"}};
      observability_->Log(ctx);
    }
    return reports;
  }
  // 스냅샷 일자는 스코프마다 단조 비감소. 같은 날짜 재실행만 허용하고, 아무것도 쓰기 전에 거부한다.
  for (const auto& params : scopes) {
    if (!HasScopeIdentity(params)) {
      continue;
    }
    auto latest = snapshots_->LatestDate(params);
    if (latest && *latest > date) {
      throw ConfigurationError("스냅샷 일자 " + date + "는 " + ScopeKey(params) + "의 최근 스냅샷 일자 " + *latest +
                               "보다 이전입니다");
    }
  }
  reports.reserve(scopes.size());
  std::uint64_t total_rows = 0;
  for (const auto& params : scopes) {
    try {
      reports.push_back(RunScope(date, params));
      total_rows += reports.back().rows_written;
    } catch (const std::exception& e) {
      SnapshotReport failed;
      failed.params = params;
      failed.date = date;
      failed.error = e.what();
      reports.push_back(std::move(failed));
      if (observability_) {
        LogContext ctx;
        ctx.name = "leaderboard.snapshot.scope_failed";
        ctx.level = LogLevel::kError;
        ctx.tournament_id = params.tournament_id;
        ctx.fields = {{"date", date}, {"scope", ScopeName(params.scope)}, {"error", e.what()}};
        observability_->Log(ctx);
      }
    }
  }
  if (observability_) {
    observability_->RecordSnapshotRun(total_rows);
  }
  return reports;
}

SnapshotReport SnapshotService::RunScope(const std::string& date, const ScopeParams& params) {
  ValidateScopeParams(params);
  auto start = std::chrono::steady_clock::now();
  SnapshotReport report;
  report.params = params;
  report.date = date;

  auto entries = computer_->Compute(params);
  report.deltas = ComputeDeltas(params, date, entries);

  std::vector<SnapshotRow> rows;
  rows.reserve(entries.size());
  for (const auto& entry : entries) {
    rows.push_back(SnapshotRow{date, params, entry.player_id, entry.team_id, entry.rank, entry.points});
  }
  report.rows_written = rows.empty() ? 0 : snapshots_->Upsert(rows);

  if (cache_) {
    for (const auto& row : rows) {
      if (row.player_id) {
        cache_->InvalidatePlayerHistory(*row.player_id, params, options_.cache_timeout);
      }
    }
  }

  report.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  if (observability_) {
    LogContext ctx;
    ctx.name = "leaderboard.snapshot.scope";
    ctx.latency_ms = report.duration_ms;
    ctx.tournament_id = params.tournament_id;
    ctx.fields = {{"date", date},
                  {"scope", ScopeName(params.scope)},
                  {"scopeKey", ScopeKey(params)},
                  {"rows", report.rows_written}};
    observability_->Log(ctx);
  }
  return report;
}

std::vector<RankDelta> SnapshotService::ComputeDeltas(const ScopeParams& params, const std::string& date,
                                                      const std::vector<LeaderboardEntry>& entries) {
  std::map<SubjectKey, int> previous;
  for (const auto& row : snapshots_->LatestBefore(params, date)) {
    previous[KeyOf(row.player_id, row.team_id)] = row.rank;
  }
  std::vector<RankDelta> deltas;
  deltas.reserve(entries.size());
  for (const auto& entry : entries) {
    RankDelta delta;
    delta.player_id = entry.player_id;
    delta.team_id = entry.team_id;
    delta.current_rank = entry.rank;
    delta.points = entry.points;
    auto it = previous.find(KeyOf(entry.player_id, entry.team_id));
    if (it != previous.end()) {
      delta.previous_rank = it->second;
      delta.rank_change = entry.rank - it->second;
    }
    deltas.push_back(delta);
  }
  return deltas;
}

std::size_t SnapshotService::Compact(const std::string& today) {
  auto cutoff = ShiftDate(today, -static_cast<int>(options_.retention_days));
  auto removed = snapshots_->PruneBefore(cutoff);
  if (observability_) {
    LogContext ctx;
    ctx.name = "leaderboard.snapshot.compact";
    ctx.fields = {{"cutoff", cutoff}, {"removed", removed}};
    observability_->Log(ctx);
  }
  return removed;
}

}  // namespace leaderboard
