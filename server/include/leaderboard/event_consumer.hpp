/*
 * 설명: 경기 완료/토너먼트 확정/시즌 변경 이벤트를 받아 관련 리더보드 캐시 키를 명시적으로 무효화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_consumer_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "leaderboard/cache_layer.hpp"
#include "leaderboard/observability.hpp"

namespace leaderboard {

enum class LeaderboardEventType { kMatchCompleted, kTournamentFinalized, kSeasonChanged };

// "match_completed", "tournament_finalized", "season_changed". 그 외는 ConfigurationError.
LeaderboardEventType ParseEventType(const std::string& name);
std::string EventTypeName(LeaderboardEventType type);

struct LeaderboardEvent {
  LeaderboardEventType type{LeaderboardEventType::kMatchCompleted};
  std::optional<std::int64_t> tournament_id;
  std::optional<std::string> season_id;
  std::optional<std::string> game_code;
};

class LeaderboardEventConsumer {
 public:
  LeaderboardEventConsumer(std::shared_ptr<CacheLayer> cache, std::chrono::milliseconds cache_timeout,
                           std::shared_ptr<Observability> observability);

  // 무효화된 스코프 목록을 반환한다. 필수 id가 없으면 ConfigurationError.
  std::vector<ScopeParams> Handle(const LeaderboardEvent& event);

 private:
  std::vector<ScopeParams> AffectedScopes(const LeaderboardEvent& event) const;

  std::shared_ptr<CacheLayer> cache_;
  std::chrono::milliseconds cache_timeout_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace leaderboard
