/*
 * 설명: 페이지네이션/필터를 적용한 PII 없는 리더보드 조회와 플레이어 순위 이력 조회를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/query_service_test.cpp, server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "leaderboard/cache_layer.hpp"
#include "leaderboard/leaderboard_types.hpp"
#include "leaderboard/snapshot_store.hpp"

namespace leaderboard {

struct LeaderboardPage {
  ScopeParams params;
  // 활성 엔트리 전체 수
  std::size_t total{0};
  std::vector<LeaderboardEntry> entries;
  ResultMetadata metadata;
};

struct PlayerHistory {
  std::int64_t player_id{0};
  ScopeParams params;
  std::vector<HistoryPoint> history;
  bool cache_hit{false};
  bool computation_enabled{true};
};

class QueryService {
 public:
  static constexpr int kDefaultLimit = 50;
  static constexpr int kMaxLimit = 100;

  QueryService(std::shared_ptr<CacheLayer> cache, std::shared_ptr<SnapshotStore> snapshots,
               std::chrono::milliseconds cache_timeout);

  // limit 1..kMaxLimit, offset >= 0 범위를 벗어나면 std::out_of_range.
  LeaderboardPage List(const ScopeParams& params, int limit, int offset);
  std::optional<LeaderboardEntry> FindPlayerRank(const ScopeParams& params, std::int64_t player_id);
  // days > 0이면 오늘(UTC)을 끝으로 하는 최근 days일만 반환한다.
  // 계산이 꺼져 있으면 스냅샷 저장소를 읽지 않고 빈 이력을 반환한다.
  PlayerHistory History(std::int64_t player_id, const ScopeParams& params, int days);

  // 테스트에서 "오늘"을 고정한다.
  void SetTodayForTest(std::string today) { today_override_ = std::move(today); }

 private:
  std::string Today() const;

  std::shared_ptr<CacheLayer> cache_;
  std::shared_ptr<SnapshotStore> snapshots_;
  std::chrono::milliseconds cache_timeout_;
  std::optional<std::string> today_override_;
};

}  // namespace leaderboard
