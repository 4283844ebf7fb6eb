/*
 * 설명: MariaDB에 저장된 토너먼트/등록/경기/누적 순위 테이블을 읽기 전용으로 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 */
#pragma once

#include <memory>

#include "leaderboard/db_client.hpp"
#include "leaderboard/record_store.hpp"

namespace leaderboard {

class MariaDbRecordStore : public RecordStore {
 public:
  explicit MariaDbRecordStore(std::shared_ptr<MariaDbClient> db_client);

  std::optional<TournamentInfo> FetchTournament(std::int64_t tournament_id) override;
  std::vector<PlacementRecord> FetchPlacements(std::int64_t tournament_id) override;
  std::vector<MatchOutcome> FetchMatchOutcomes(std::int64_t tournament_id) override;
  std::vector<StandingRecord> FetchStandings(const ScopeParams& params) override;
  std::vector<std::int64_t> FetchActiveTournamentIds() override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace leaderboard
