/*
 * 설명: 리더보드 페이지 조회와 플레이어 순위 이력 조회를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/query_service_test.cpp
 */
#include "leaderboard/query_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace leaderboard {

QueryService::QueryService(std::shared_ptr<CacheLayer> cache, std::shared_ptr<SnapshotStore> snapshots,
                           std::chrono::milliseconds cache_timeout)
    : cache_(std::move(cache)), snapshots_(std::move(snapshots)), cache_timeout_(cache_timeout) {}

LeaderboardPage QueryService::List(const ScopeParams& params, int limit, int offset) {
  if (limit < 1 || limit > kMaxLimit) {
    throw std::out_of_range("limit은 1에서 " + std::to_string(kMaxLimit) + " 사이여야 합니다");
  }
  if (offset < 0) {
    throw std::out_of_range("offset은 0 이상이어야 합니다");
  }
  auto result = cache_->GetOrCompute(params, cache_timeout_);

  std::vector<LeaderboardEntry> active;
  active.reserve(result.entries.size());
  for (auto& entry : result.entries) {
    if (entry.is_active && entry.rank > 0) {
      active.push_back(std::move(entry));
    }
  }
  std::sort(active.begin(), active.end(),
            [](const LeaderboardEntry& a, const LeaderboardEntry& b) { return a.rank < b.rank; });

  LeaderboardPage page;
  page.params = result.params;
  page.total = active.size();
  page.metadata = result.metadata;
  auto begin = std::min(active.size(), static_cast<std::size_t>(offset));
  auto end = std::min(active.size(), begin + static_cast<std::size_t>(limit));
  page.entries.assign(std::make_move_iterator(active.begin() + begin), std::make_move_iterator(active.begin() + end));
  page.metadata.count = page.entries.size();
  return page;
}

std::optional<LeaderboardEntry> QueryService::FindPlayerRank(const ScopeParams& params, std::int64_t player_id) {
  auto result = cache_->GetOrCompute(params, cache_timeout_);
  for (const auto& entry : result.entries) {
    if (entry.is_active && entry.player_id && *entry.player_id == player_id) {
      return entry;
    }
  }
  return std::nullopt;
}

PlayerHistory QueryService::History(std::int64_t player_id, const ScopeParams& params, int days) {
  ValidateScopeParams(params);
  PlayerHistory out;
  out.player_id = player_id;
  out.params = params;
  if (!cache_->Flags().compute_enabled) {
    out.computation_enabled = false;
    return out;
  }

  auto cached = cache_->GetPlayerHistory(player_id, params, cache_timeout_);
  if (cached) {
    out.history = std::move(*cached);
    out.cache_hit = true;
  } else {
    out.history = snapshots_->History(player_id, params, std::nullopt);
    cache_->PutPlayerHistory(player_id, params, out.history, cache_timeout_);
  }

  // 날짜가 엄격히 증가하도록 정렬 후 같은 날짜는 첫 행만 남긴다.
  std::stable_sort(out.history.begin(), out.history.end(),
                   [](const HistoryPoint& a, const HistoryPoint& b) { return a.date < b.date; });
  out.history.erase(std::unique(out.history.begin(), out.history.end(),
                                [](const HistoryPoint& a, const HistoryPoint& b) { return a.date == b.date; }),
                    out.history.end());

  if (days > 0) {
    const auto since = ShiftDate(Today(), -(days - 1));
    out.history.erase(std::remove_if(out.history.begin(), out.history.end(),
                                     [&since](const HistoryPoint& p) { return p.date < since; }),
                      out.history.end());
  }
  return out;
}

std::string QueryService::Today() const {
  if (today_override_) {
    return *today_override_;
  }
  return ToDateString(std::chrono::system_clock::now());
}

}  // namespace leaderboard
