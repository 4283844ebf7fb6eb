/*
 * 설명: 일자별 순위 스냅샷 테이블의 저장소 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/snapshot_service_test.cpp, server/tests/it/snapshot_upsert_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "leaderboard/leaderboard_types.hpp"

namespace leaderboard {

class SnapshotStore {
 public:
  virtual ~SnapshotStore() = default;

  // (date, scope, game, player, team) 키 기준 upsert. 동시 실행은 저장소의 네이티브 upsert로 last-write-wins.
  virtual std::size_t Upsert(const std::vector<SnapshotRow>& rows) = 0;
  // 날짜 오름차순. since_date가 있으면 그 날짜 이후(포함)만.
  virtual std::vector<HistoryPoint> History(std::int64_t player_id, const ScopeParams& params,
                                            const std::optional<std::string>& since_date) = 0;
  // date 이전 가장 최근 스냅샷 일자의 행들.
  virtual std::vector<SnapshotRow> LatestBefore(const ScopeParams& params, const std::string& date) = 0;
  // 스코프에 기록된 가장 최근 스냅샷 일자. 없으면 nullopt.
  virtual std::optional<std::string> LatestDate(const ScopeParams& params) = 0;
  virtual std::vector<SnapshotRow> RowsForDate(const ScopeParams& params, const std::string& date) = 0;
  virtual std::size_t PruneBefore(const std::string& cutoff_date) = 0;
};

// 스냅샷 테이블의 scope_ref 컬럼 값: tournament id, season id, 또는 빈 문자열
std::string SnapshotScopeRef(const ScopeParams& params);

}  // namespace leaderboard
