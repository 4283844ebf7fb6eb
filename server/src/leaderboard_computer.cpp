/*
 * 설명: 토너먼트/시즌/전체 스코프 순위 계산과 타이브레이크, 순위 부여를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_computer_test.cpp
 */
#include "leaderboard/leaderboard_computer.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <utility>

namespace leaderboard {
namespace {
using SubjectKey = std::pair<std::int64_t, std::int64_t>;

SubjectKey KeyOf(const std::optional<std::int64_t>& player_id, const std::optional<std::int64_t>& team_id) {
  return {player_id.value_or(0), team_id.value_or(0)};
}

// 팀 대회면 팀 기준, 개인 대회면 플레이어 기준으로 승패를 센다.
SubjectKey WinnerKey(const MatchOutcome& outcome) {
  if (outcome.winner_team_id) {
    return {0, *outcome.winner_team_id};
  }
  return {outcome.winner_player_id.value_or(0), 0};
}

SubjectKey LoserKey(const MatchOutcome& outcome) {
  if (outcome.loser_team_id) {
    return {0, *outcome.loser_team_id};
  }
  return {outcome.loser_player_id.value_or(0), 0};
}

SubjectKey TallyKey(const PlacementRecord& record) {
  if (record.team_id) {
    return {0, *record.team_id};
  }
  return {record.player_id.value_or(0), 0};
}
}  // namespace

LeaderboardComputer::LeaderboardComputer(std::shared_ptr<RecordStore> records,
                                         std::shared_ptr<const ScoringRegistry> scoring,
                                         std::shared_ptr<Observability> observability)
    : records_(std::move(records)), scoring_(std::move(scoring)), observability_(std::move(observability)) {}

std::vector<LeaderboardEntry> LeaderboardComputer::Compute(const ScopeParams& params) {
  ValidateScopeParams(params);
  auto start = std::chrono::steady_clock::now();
  std::vector<LeaderboardEntry> entries = params.scope == Scope::kTournament ? ComputeTournament(*params.tournament_id)
                                                                              : ComputeStandings(params);
  if (observability_) {
    observability_->RecordComputation();
    auto latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    LogContext ctx;
    ctx.name = "leaderboard.compute";
    ctx.latency_ms = latency;
    ctx.tournament_id = params.tournament_id;
    ctx.fields = {{"scope", ScopeName(params.scope)}, {"source", "live"}, {"entryCount", entries.size()}};
    observability_->Log(ctx);
  }
  return entries;
}

std::vector<LeaderboardEntry> LeaderboardComputer::ComputeTournament(std::int64_t tournament_id) {
  auto tournament = records_->FetchTournament(tournament_id);
  if (!tournament) {
    return {};
  }
  auto placements = records_->FetchPlacements(tournament_id);
  if (placements.empty()) {
    return {};
  }
  auto outcomes = records_->FetchMatchOutcomes(tournament_id);

  std::map<SubjectKey, std::pair<int, int>> tally;
  for (const auto& outcome : outcomes) {
    ++tally[WinnerKey(outcome)].first;
    ++tally[LoserKey(outcome)].second;
  }

  const ScoringTable& table = scoring_->Resolve(tournament->format, tournament->game_code);
  std::vector<Candidate> candidates;
  candidates.reserve(placements.size());
  std::size_t skipped = 0;
  for (const auto& record : placements) {
    if (record.subject_deleted) {
      ++skipped;
      continue;
    }
    if (!record.is_active || record.placement <= 0) {
      continue;
    }
    auto it = tally.find(TallyKey(record));
    int wins = it == tally.end() ? 0 : it->second.first;
    int losses = it == tally.end() ? 0 : it->second.second;

    LeaderboardEntry entry;
    entry.player_id = record.player_id;
    entry.team_id = record.team_id;
    entry.points = table.PlacementPoints(record.placement) + table.WinBonus(wins);
    entry.wins = wins;
    entry.losses = losses;
    entry.win_rate = WinRate(wins, losses);
    entry.is_active = true;
    entry.last_updated = record.last_updated;
    candidates.push_back(Candidate{entry, record.placement, record.registered_at});
  }
  LogSkipped(ScopeParams::Tournament(tournament_id), skipped);

  // 순위 오름차순 → 승리 내림차순 → 등록 시각 오름차순 → 주체 ID 오름차순
  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.placement != b.placement) {
      return a.placement < b.placement;
    }
    if (a.entry.wins != b.entry.wins) {
      return a.entry.wins > b.entry.wins;
    }
    if (a.registered_at != b.registered_at) {
      return a.registered_at < b.registered_at;
    }
    return SubjectOrder(a.entry) < SubjectOrder(b.entry);
  });
  return AssignRanks(std::move(candidates));
}

std::vector<LeaderboardEntry> LeaderboardComputer::ComputeStandings(const ScopeParams& params) {
  auto standings = records_->FetchStandings(params);
  std::vector<Candidate> candidates;
  candidates.reserve(standings.size());
  std::size_t skipped = 0;
  for (const auto& record : standings) {
    if (record.subject_deleted) {
      ++skipped;
      continue;
    }
    if (!record.is_active) {
      continue;
    }
    LeaderboardEntry entry;
    entry.player_id = record.player_id;
    entry.team_id = record.team_id;
    entry.points = record.points;
    entry.wins = record.wins;
    entry.losses = record.losses;
    entry.win_rate = WinRate(record.wins, record.losses);
    entry.is_active = true;
    entry.last_updated = record.last_updated;
    candidates.push_back(Candidate{entry, 0, record.registered_at});
  }
  LogSkipped(params, skipped);

  // 점수 내림차순 → 승리 내림차순 → 등록 시각 오름차순 → 주체 ID 오름차순
  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
    if (a.entry.points != b.entry.points) {
      return a.entry.points > b.entry.points;
    }
    if (a.entry.wins != b.entry.wins) {
      return a.entry.wins > b.entry.wins;
    }
    if (a.registered_at != b.registered_at) {
      return a.registered_at < b.registered_at;
    }
    return SubjectOrder(a.entry) < SubjectOrder(b.entry);
  });
  return AssignRanks(std::move(candidates));
}

void LeaderboardComputer::LogSkipped(const ScopeParams& params, std::size_t skipped) const {
  if (skipped == 0 || !observability_) {
    return;
  }
  LogContext ctx;
  ctx.name = "leaderboard.compute.skipped_deleted";
  ctx.level = LogLevel::kWarn;
  ctx.tournament_id = params.tournament_id;
  ctx.fields = {{"scope", ScopeName(params.scope)}, {"skipped", skipped}};
  observability_->Log(ctx);
}

std::int64_t LeaderboardComputer::SubjectOrder(const LeaderboardEntry& entry) {
  if (entry.team_id) {
    return *entry.team_id;
  }
  return entry.player_id.value_or(0);
}

std::vector<LeaderboardEntry> LeaderboardComputer::AssignRanks(std::vector<Candidate> candidates) {
  std::vector<LeaderboardEntry> entries;
  entries.reserve(candidates.size());
  int rank = 1;
  for (auto& candidate : candidates) {
    candidate.entry.rank = rank++;
    entries.push_back(std::move(candidate.entry));
  }
  return entries;
}

}  // namespace leaderboard
