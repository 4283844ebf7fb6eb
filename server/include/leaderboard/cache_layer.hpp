/*
 * 설명: 스코프별 TTL을 가진 read-through 리더보드 캐시와 명시적 무효화를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cache_layer_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "leaderboard/cache_backend.hpp"
#include "leaderboard/config.hpp"
#include "leaderboard/leaderboard_computer.hpp"
#include "leaderboard/leaderboard_types.hpp"
#include "leaderboard/observability.hpp"

namespace leaderboard {

class CacheLayer {
 public:
  CacheLayer(std::shared_ptr<CacheBackend> backend, std::shared_ptr<LeaderboardComputer> computer,
             FeatureFlags flags, CacheTtlConfig ttl, std::shared_ptr<Observability> observability);

  // 캐시 적중 시 cached_at, 계산 시 queried_at을 채운다. 캐시 백엔드 장애는 직접 계산으로 대체한다.
  LeaderboardResult GetOrCompute(const ScopeParams& params, std::chrono::milliseconds timeout);

  // 해당 스코프의 키 하나만 지운다. season_id 없는 season은 ConfigurationError.
  // 캐시가 꺼져 있거나 백엔드 삭제가 실패하면 false.
  bool Invalidate(const ScopeParams& params, std::chrono::milliseconds timeout);

  std::optional<std::vector<HistoryPoint>> GetPlayerHistory(std::int64_t player_id, const ScopeParams& params,
                                                            std::chrono::milliseconds timeout);
  void PutPlayerHistory(std::int64_t player_id, const ScopeParams& params, const std::vector<HistoryPoint>& history,
                        std::chrono::milliseconds timeout);
  bool InvalidatePlayerHistory(std::int64_t player_id, const ScopeParams& params, std::chrono::milliseconds timeout);

  const FeatureFlags& Flags() const { return flags_; }

  // "lb:tournament:42", "lb:season:2025_S1:ALL", "lb:all_time:valorant"
  static std::string CacheKey(const ScopeParams& params);
  static std::string PlayerHistoryKey(std::int64_t player_id, const ScopeParams& params);
  std::chrono::seconds TtlFor(Scope scope) const;

 private:
  void LogBackendFailure(const std::string& op, const std::string& key, const std::exception& e) const;
  void LogRead(const ScopeParams& params, const std::string& source, std::size_t count) const;

  std::shared_ptr<CacheBackend> backend_;
  std::shared_ptr<LeaderboardComputer> computer_;
  FeatureFlags flags_;
  CacheTtlConfig ttl_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace leaderboard
