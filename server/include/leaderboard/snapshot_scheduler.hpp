/*
 * 설명: io_context 타이머로 일일 스냅샷 작업과 보존 기간 정리를 주기 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/snapshot_service_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "leaderboard/observability.hpp"
#include "leaderboard/snapshot_service.hpp"

namespace leaderboard {

class SnapshotScheduler : public std::enable_shared_from_this<SnapshotScheduler> {
 public:
  SnapshotScheduler(boost::asio::io_context& ioc, std::shared_ptr<SnapshotService> service,
                    std::chrono::seconds interval, std::shared_ptr<Observability> observability);

  void Start();
  void Stop();
  // 한 주기 분량의 작업을 즉시 수행한다. 실행 중이면 false.
  bool RunOnce();
  std::uint64_t CompletedRuns() const { return completed_runs_.load(); }

  void SetTodayProviderForTest(std::function<std::string()> today) { today_ = std::move(today); }

 private:
  void Schedule();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::steady_timer timer_;
  std::shared_ptr<SnapshotService> service_;
  std::chrono::seconds interval_;
  std::shared_ptr<Observability> observability_;
  std::function<std::string()> today_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<std::uint64_t> completed_runs_{0};
};

}  // namespace leaderboard
