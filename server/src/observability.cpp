/*
 * 설명: 구조화 로그와 요청/캐시/스냅샷 메트릭 카운터를 관리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "leaderboard/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace leaderboard {

LogLevel ParseLogLevel(const std::string& name) {
  if (name == "debug") {
    return LogLevel::kDebug;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::kWarn;
  }
  if (name == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::RecordCacheHit() { cache_hits_.fetch_add(1); }

void Observability::RecordCacheMiss() { cache_misses_.fetch_add(1); }

void Observability::RecordCacheError() { cache_errors_.fetch_add(1); }

void Observability::RecordComputation() { computations_.fetch_add(1); }

void Observability::RecordSnapshotRun(std::uint64_t rows) {
  snapshot_runs_.fetch_add(1);
  snapshot_rows_.fetch_add(rows);
}

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.cache_hits = cache_hits_.load();
  snapshot.cache_misses = cache_misses_.load();
  snapshot.cache_errors = cache_errors_.load();
  snapshot.computations = computations_.load();
  snapshot.snapshot_runs = snapshot_runs_.load();
  snapshot.snapshot_rows = snapshot_rows_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (static_cast<int>(ctx.level) < static_cast<int>(min_level_)) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LogLevelName(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.player_id) {
    log_json["playerId"] = *ctx.player_id;
  }
  if (ctx.tournament_id) {
    log_json["tournamentId"] = *ctx.tournament_id;
  }
  for (auto it = ctx.fields.begin(); it != ctx.fields.end(); ++it) {
    log_json[it.key()] = it.value();
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << log_json.dump() << std::endl;
}

}  // namespace leaderboard
