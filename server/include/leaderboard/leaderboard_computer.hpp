/*
 * 설명: 스코프별 원천 기록으로부터 타이브레이크 규칙을 적용해 연속 순위 목록을 만든다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_computer_test.cpp
 */
#pragma once

#include <memory>
#include <vector>

#include "leaderboard/leaderboard_types.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/record_store.hpp"
#include "leaderboard/scoring.hpp"

namespace leaderboard {

class LeaderboardComputer {
 public:
  LeaderboardComputer(std::shared_ptr<RecordStore> records, std::shared_ptr<const ScoringRegistry> scoring,
                      std::shared_ptr<Observability> observability);

  // 활성 엔트리만, rank 1..N 오름차순. 저장소 장애는 그대로 전파한다.
  std::vector<LeaderboardEntry> Compute(const ScopeParams& params);

 private:
  // 타이브레이크 체인을 거친 후보. rank만 비어 있다.
  struct Candidate {
    LeaderboardEntry entry;
    int placement;
    std::chrono::system_clock::time_point registered_at;
  };

  std::vector<LeaderboardEntry> ComputeTournament(std::int64_t tournament_id);
  std::vector<LeaderboardEntry> ComputeStandings(const ScopeParams& params);
  void LogSkipped(const ScopeParams& params, std::size_t skipped) const;

  static std::int64_t SubjectOrder(const LeaderboardEntry& entry);
  static std::vector<LeaderboardEntry> AssignRanks(std::vector<Candidate> candidates);

  std::shared_ptr<RecordStore> records_;
  std::shared_ptr<const ScoringRegistry> scoring_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace leaderboard
