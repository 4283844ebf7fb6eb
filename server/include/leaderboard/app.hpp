/*
 * 설명: 서버 전체 수명주기와 리더보드 서비스 조립을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "leaderboard/cache_backend.hpp"
#include "leaderboard/cache_layer.hpp"
#include "leaderboard/config.hpp"
#include "leaderboard/event_consumer.hpp"
#include "leaderboard/leaderboard_computer.hpp"
#include "leaderboard/observability.hpp"
#include "leaderboard/query_service.hpp"
#include "leaderboard/record_store.hpp"
#include "leaderboard/scoring.hpp"
#include "leaderboard/snapshot_scheduler.hpp"
#include "leaderboard/snapshot_service.hpp"
#include "leaderboard/snapshot_store.hpp"

namespace leaderboard {

class Listener;

class ServerApp {
 public:
  // MariaDB 저장소와 프로세스 내 캐시로 조립한다.
  explicit ServerApp(const AppConfig& config);
  // 저장소/캐시 포트를 주입한다. e2e 테스트가 사용한다.
  ServerApp(const AppConfig& config, std::shared_ptr<RecordStore> records, std::shared_ptr<SnapshotStore> snapshots,
            std::shared_ptr<CacheBackend> cache_backend, std::shared_ptr<Observability> observability = nullptr);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<QueryService> GetQueryService() { return query_service_; }
  std::shared_ptr<CacheLayer> GetCacheLayer() { return cache_; }
  std::shared_ptr<SnapshotService> GetSnapshotService() { return snapshot_service_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void Assemble();
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RecordStore> records_;
  std::shared_ptr<SnapshotStore> snapshots_;
  std::shared_ptr<CacheBackend> cache_backend_;
  std::shared_ptr<const ScoringRegistry> scoring_;
  std::shared_ptr<LeaderboardComputer> computer_;
  std::shared_ptr<CacheLayer> cache_;
  std::shared_ptr<QueryService> query_service_;
  std::shared_ptr<SnapshotService> snapshot_service_;
  std::shared_ptr<SnapshotScheduler> scheduler_;
  std::shared_ptr<LeaderboardEventConsumer> event_consumer_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace leaderboard
