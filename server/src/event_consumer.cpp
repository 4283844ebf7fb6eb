/*
 * 설명: 리더보드 이벤트별 영향 스코프 계산과 캐시 무효화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_consumer_test.cpp
 */
#include "leaderboard/event_consumer.hpp"

#include <utility>

#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
// 게임 필터가 있으면 해당 게임 키와 전체(ALL) 키를 모두 포함한다.
void AppendWithGameVariants(std::vector<ScopeParams>& scopes, ScopeParams base,
                            const std::optional<std::string>& game_code) {
  base.game_code.reset();
  scopes.push_back(base);
  if (game_code && !game_code->empty()) {
    base.game_code = game_code;
    scopes.push_back(base);
  }
}
}  // namespace

LeaderboardEventType ParseEventType(const std::string& name) {
  if (name == "match_completed") {
    return LeaderboardEventType::kMatchCompleted;
  }
  if (name == "tournament_finalized") {
    return LeaderboardEventType::kTournamentFinalized;
  }
  if (name == "season_changed") {
    return LeaderboardEventType::kSeasonChanged;
  }
  throw ConfigurationError("알 수 없는 이벤트입니다: " + name);
}

std::string EventTypeName(LeaderboardEventType type) {
  switch (type) {
    case LeaderboardEventType::kMatchCompleted:
      return "match_completed";
    case LeaderboardEventType::kTournamentFinalized:
      return "tournament_finalized";
    case LeaderboardEventType::kSeasonChanged:
      return "season_changed";
  }
  return "match_completed";
}

LeaderboardEventConsumer::LeaderboardEventConsumer(std::shared_ptr<CacheLayer> cache,
                                                   std::chrono::milliseconds cache_timeout,
                                                   std::shared_ptr<Observability> observability)
    : cache_(std::move(cache)), cache_timeout_(cache_timeout), observability_(std::move(observability)) {}

std::vector<ScopeParams> LeaderboardEventConsumer::AffectedScopes(const LeaderboardEvent& event) const {
  std::vector<ScopeParams> scopes;
  switch (event.type) {
    case LeaderboardEventType::kMatchCompleted:
      if (!event.tournament_id) {
        throw ConfigurationError("match_completed 이벤트에는 tournamentId가 필요합니다");
      }
      scopes.push_back(ScopeParams::Tournament(*event.tournament_id));
      break;
    case LeaderboardEventType::kTournamentFinalized:
      if (!event.tournament_id) {
        throw ConfigurationError("tournament_finalized 이벤트에는 tournamentId가 필요합니다");
      }
      scopes.push_back(ScopeParams::Tournament(*event.tournament_id));
      if (event.season_id && !event.season_id->empty()) {
        AppendWithGameVariants(scopes, ScopeParams::Season(*event.season_id), event.game_code);
      }
      AppendWithGameVariants(scopes, ScopeParams::AllTime(), event.game_code);
      break;
    case LeaderboardEventType::kSeasonChanged:
      if (!event.season_id || event.season_id->empty()) {
        throw ConfigurationError("season_changed 이벤트에는 seasonId가 필요합니다");
      }
      AppendWithGameVariants(scopes, ScopeParams::Season(*event.season_id), event.game_code);
      AppendWithGameVariants(scopes, ScopeParams::AllTime(), event.game_code);
      break;
  }
  return scopes;
}

std::vector<ScopeParams> LeaderboardEventConsumer::Handle(const LeaderboardEvent& event) {
  auto scopes = AffectedScopes(event);
  std::vector<ScopeParams> invalidated;
  for (const auto& params : scopes) {
    if (cache_->Invalidate(params, cache_timeout_)) {
      invalidated.push_back(params);
    }
  }
  if (observability_) {
    LogContext ctx;
    ctx.name = "leaderboard.event";
    ctx.tournament_id = event.tournament_id;
    ctx.fields = {{"event", EventTypeName(event.type)}, {"affected", scopes.size()},
                  {"invalidated", invalidated.size()}};
    observability_->Log(ctx);
  }
  return invalidated;
}

}  // namespace leaderboard
