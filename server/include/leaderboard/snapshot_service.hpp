/*
 * 설명: 추적 스코프마다 일자별 순위 스냅샷을 멱등 upsert하고 전일 대비 순위 변화를 계산한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/snapshot_service_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "leaderboard/cache_layer.hpp"
#include "leaderboard/leaderboard_computer.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/record_store.hpp"
#include "leaderboard/snapshot_store.hpp"

namespace leaderboard {

struct SnapshotReport {
  ScopeParams params;
  std::string date;
  std::size_t rows_written{0};
  long duration_ms{0};
  std::vector<RankDelta> deltas;
  // 해당 스코프 처리 중 발생한 오류. 다른 스코프는 계속 처리된다.
  std::optional<std::string> error;
};

struct SnapshotServiceOptions {
  std::vector<ScopeParams> tracked_scopes;
  std::size_t retention_days{365};
  std::chrono::milliseconds cache_timeout{50};
};

class SnapshotService {
 public:
  SnapshotService(std::shared_ptr<LeaderboardComputer> computer, std::shared_ptr<SnapshotStore> snapshots,
                  std::shared_ptr<RecordStore> records, std::shared_ptr<CacheLayer> cache,
                  SnapshotServiceOptions options, std::shared_ptr<Observability> observability);

  // 설정된 스코프와 진행 중인 모든 토너먼트를 대상으로 실행한다.
  std::vector<SnapshotReport> Run(const std::string& date);
  // 어느 스코프든 date보다 늦은 스냅샷이 이미 있으면 ConfigurationError.
  std::vector<SnapshotReport> Run(const std::string& date, const std::vector<ScopeParams>& scopes);
  SnapshotReport RunScope(const std::string& date, const ScopeParams& params);

  // today 기준 보존 기간보다 오래된 스냅샷 행을 지운다.
  std::size_t Compact(const std::string& today);
  std::vector<ScopeParams> TrackedScopes();

 private:
  std::vector<RankDelta> ComputeDeltas(const ScopeParams& params, const std::string& date,
                                       const std::vector<LeaderboardEntry>& entries);

  std::shared_ptr<LeaderboardComputer> computer_;
  std::shared_ptr<SnapshotStore> snapshots_;
  std::shared_ptr<RecordStore> records_;
  std::shared_ptr<CacheLayer> cache_;
  SnapshotServiceOptions options_;
  std::shared_ptr<Observability> observability_;
  // 스케줄러와 운영 엔드포인트의 동시 실행을 막는다.
  std::mutex run_mutex_;
};

}  // namespace leaderboard
