/*
 * 설명: leaderboard_snapshots 테이블에 스냅샷을 upsert하고 이력을 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/snapshot_upsert_it_test.cpp
 */
#pragma once

#include <memory>

#include "leaderboard/db_client.hpp"
#include "leaderboard/snapshot_store.hpp"

namespace leaderboard {

class MariaDbSnapshotStore : public SnapshotStore {
 public:
  explicit MariaDbSnapshotStore(std::shared_ptr<MariaDbClient> db_client);

  std::size_t Upsert(const std::vector<SnapshotRow>& rows) override;
  std::vector<HistoryPoint> History(std::int64_t player_id, const ScopeParams& params,
                                    const std::optional<std::string>& since_date) override;
  std::vector<SnapshotRow> LatestBefore(const ScopeParams& params, const std::string& date) override;
  std::optional<std::string> LatestDate(const ScopeParams& params) override;
  std::vector<SnapshotRow> RowsForDate(const ScopeParams& params, const std::string& date) override;
  std::size_t PruneBefore(const std::string& cutoff_date) override;

  std::size_t Count() const;
  void ClearAll() const;

 private:
  std::string ScopeFilter(MYSQL* conn, const ScopeParams& params) const;
  std::vector<SnapshotRow> SelectRows(MYSQL* conn, const ScopeParams& params, const std::string& date) const;

  std::shared_ptr<MariaDbClient> db_client_;
  // 한 INSERT 문에 묶는 최대 행 수
  const std::size_t batch_size_ = 500;
};

}  // namespace leaderboard
