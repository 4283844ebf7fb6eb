/*
 * 설명: 토너먼트/경기/등록/정체성 기록에 대한 읽기 전용 저장소 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_computer_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "leaderboard/leaderboard_types.hpp"

namespace leaderboard {

// 엔진은 이 저장소에 쓰지 않는다. 구현체의 장애는 예외(DbException 등)로 전파된다.
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  virtual std::optional<TournamentInfo> FetchTournament(std::int64_t tournament_id) = 0;
  // placement가 NULL이 아닌 참가 기록만 반환한다.
  virtual std::vector<PlacementRecord> FetchPlacements(std::int64_t tournament_id) = 0;
  // 완료된 경기만 반환한다.
  virtual std::vector<MatchOutcome> FetchMatchOutcomes(std::int64_t tournament_id) = 0;
  // season/all_time 스코프의 누적 집계.
  virtual std::vector<StandingRecord> FetchStandings(const ScopeParams& params) = 0;
  virtual std::vector<std::int64_t> FetchActiveTournamentIds() = 0;
};

}  // namespace leaderboard
