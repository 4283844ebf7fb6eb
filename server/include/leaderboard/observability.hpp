/*
 * 설명: 구조화 로그와 요청/캐시/스냅샷 메트릭 카운터를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace leaderboard {

enum class LogLevel { kDebug, kInfo, kWarn, kError };

LogLevel ParseLogLevel(const std::string& name);
std::string LogLevelName(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::optional<std::int64_t> player_id;
  std::optional<std::int64_t> tournament_id;
  // scope, source(cache|live|disabled), 카운트 등 컴포넌트별 필드. ID만 담는다.
  nlohmann::json fields = nlohmann::json::object();
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t cache_hits{0};
  std::uint64_t cache_misses{0};
  std::uint64_t cache_errors{0};
  std::uint64_t computations{0};
  std::uint64_t snapshot_runs{0};
  std::uint64_t snapshot_rows{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void RecordCacheHit();
  void RecordCacheMiss();
  void RecordCacheError();
  void RecordComputation();
  void RecordSnapshotRun(std::uint64_t rows);
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> cache_misses_{0};
  std::atomic<std::uint64_t> cache_errors_{0};
  std::atomic<std::uint64_t> computations_{0};
  std::atomic<std::uint64_t> snapshot_runs_{0};
  std::atomic<std::uint64_t> snapshot_rows_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace leaderboard
