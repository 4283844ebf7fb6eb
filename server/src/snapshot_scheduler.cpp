/*
 * 설명: 스냅샷 스케줄러의 타이머 루프를 구현한다. 실패한 실행은 로그 후 다음 주기에 재시도된다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/snapshot_service_test.cpp
 */
#include "leaderboard/snapshot_scheduler.hpp"

#include <utility>

namespace leaderboard {

SnapshotScheduler::SnapshotScheduler(boost::asio::io_context& ioc, std::shared_ptr<SnapshotService> service,
                                     std::chrono::seconds interval, std::shared_ptr<Observability> observability)
    : timer_(ioc),
      service_(std::move(service)),
      interval_(interval.count() > 0 ? interval : std::chrono::seconds(86400)),
      observability_(std::move(observability)),
      today_([] { return ToDateString(std::chrono::system_clock::now()); }) {}

void SnapshotScheduler::Start() {
  stopped_ = false;
  Schedule();
}

void SnapshotScheduler::Stop() {
  stopped_ = true;
  timer_.cancel();
}

void SnapshotScheduler::Schedule() {
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void SnapshotScheduler::OnTick(const boost::system::error_code& ec) {
  if (ec || stopped_) {
    return;
  }
  RunOnce();
  Schedule();
}

bool SnapshotScheduler::RunOnce() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return false;
  }
  auto today = today_();
  try {
    auto reports = service_->Run(today);
    service_->Compact(today);
    completed_runs_.fetch_add(1);
    if (observability_) {
      LogContext ctx;
      ctx.name = "leaderboard.snapshot.run";
      ctx.fields = {{"date", today}, {"scopes", reports.size()}};
      observability_->Log(ctx);
    }
  } catch (const std::exception& e) {
    if (observability_) {
      LogContext ctx;
      ctx.name = "leaderboard.snapshot.run_failed";
      ctx.level = LogLevel::kError;
      ctx.fields = {{"date", today}, {"error", e.what()}};
      observability_->Log(ctx);
    }
  }
  running_ = false;
  return true;
}

}  // namespace leaderboard
