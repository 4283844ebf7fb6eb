/*
 * 설명: 스냅샷 저장소 공용 헬퍼.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "leaderboard/snapshot_store.hpp"

namespace leaderboard {

std::string SnapshotScopeRef(const ScopeParams& params) {
  ValidateScopeParams(params);
  switch (params.scope) {
    case Scope::kTournament:
      return std::to_string(*params.tournament_id);
    case Scope::kSeason:
      return *params.season_id;
    case Scope::kAllTime:
      return "";
  }
  return "";
}

}  // namespace leaderboard
