/*
 * 설명: 리더보드 read-through 캐시, 기능 플래그 처리, 캐시 장애 시 fail-open을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cache_layer_test.cpp
 */
#include "leaderboard/cache_layer.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
constexpr const char* kKeyPrefix = "lb:";
}  // namespace

CacheLayer::CacheLayer(std::shared_ptr<CacheBackend> backend, std::shared_ptr<LeaderboardComputer> computer,
                       FeatureFlags flags, CacheTtlConfig ttl, std::shared_ptr<Observability> observability)
    : backend_(std::move(backend)),
      computer_(std::move(computer)),
      flags_(flags),
      ttl_(ttl),
      observability_(std::move(observability)) {}

std::string CacheLayer::CacheKey(const ScopeParams& params) { return kKeyPrefix + ScopeKey(params); }

std::string CacheLayer::PlayerHistoryKey(std::int64_t player_id, const ScopeParams& params) {
  return std::string(kKeyPrefix) + "player_history:" + std::to_string(player_id) + ":" + ScopeKey(params);
}

std::chrono::seconds CacheLayer::TtlFor(Scope scope) const {
  switch (scope) {
    case Scope::kTournament:
      return std::chrono::seconds(ttl_.tournament_seconds);
    case Scope::kSeason:
      return std::chrono::seconds(ttl_.season_seconds);
    case Scope::kAllTime:
      return std::chrono::seconds(ttl_.all_time_seconds);
  }
  return std::chrono::seconds(ttl_.all_time_seconds);
}

LeaderboardResult CacheLayer::GetOrCompute(const ScopeParams& params, std::chrono::milliseconds timeout) {
  ValidateScopeParams(params);
  LeaderboardResult result;
  result.params = params;

  if (!flags_.compute_enabled) {
    result.metadata.computation_enabled = false;
    LogRead(params, "disabled", 0);
    return result;
  }

  const auto key = CacheKey(params);
  if (flags_.cache_enabled && backend_) {
    try {
      auto cached = backend_->Get(key, timeout);
      if (cached) {
        auto payload = nlohmann::json::parse(*cached);
        for (const auto& item : payload.at("entries")) {
          result.entries.push_back(EntryFromJson(item));
        }
        result.metadata.cache_hit = true;
        result.metadata.cached_at = payload.at("cachedAt").get<std::string>();
        result.metadata.count = result.entries.size();
        if (observability_) {
          observability_->RecordCacheHit();
        }
        LogRead(params, "cache", result.entries.size());
        return result;
      }
      if (observability_) {
        observability_->RecordCacheMiss();
      }
    } catch (const CacheBackendError& e) {
      LogBackendFailure("get", key, e);
    } catch (const nlohmann::json::exception& e) {
      // 손상된 값은 미스로 취급하고 다시 계산해 덮어쓴다.
      result.entries.clear();
      LogBackendFailure("decode", key, e);
    } catch (const ConfigurationError& e) {
      result.entries.clear();
      LogBackendFailure("decode", key, e);
    }
  }

  result.entries = computer_->Compute(params);
  const auto now = ToIsoString(std::chrono::system_clock::now());
  result.metadata.queried_at = now;
  result.metadata.count = result.entries.size();

  if (flags_.cache_enabled && backend_ && !result.entries.empty()) {
    nlohmann::json payload{{"entries", nlohmann::json::array()}, {"cachedAt", now}};
    for (const auto& entry : result.entries) {
      payload["entries"].push_back(EntryToJson(entry));
    }
    try {
      backend_->Set(key, payload.dump(), TtlFor(params.scope), timeout);
    } catch (const CacheBackendError& e) {
      LogBackendFailure("set", key, e);
    }
  }
  LogRead(params, "live", result.entries.size());
  return result;
}

bool CacheLayer::Invalidate(const ScopeParams& params, std::chrono::milliseconds timeout) {
  ValidateScopeParams(params);
  if (!flags_.cache_enabled || !backend_) {
    return false;
  }
  const auto key = CacheKey(params);
  try {
    backend_->Delete(key, timeout);
  } catch (const CacheBackendError& e) {
    LogBackendFailure("delete", key, e);
    return false;
  }
  if (observability_) {
    LogContext ctx;
    ctx.name = "leaderboard.cache.invalidate";
    ctx.tournament_id = params.tournament_id;
    ctx.fields = {{"scope", ScopeName(params.scope)}, {"key", key}};
    observability_->Log(ctx);
  }
  return true;
}

std::optional<std::vector<HistoryPoint>> CacheLayer::GetPlayerHistory(std::int64_t player_id,
                                                                      const ScopeParams& params,
                                                                      std::chrono::milliseconds timeout) {
  if (!flags_.cache_enabled || !backend_) {
    return std::nullopt;
  }
  const auto key = PlayerHistoryKey(player_id, params);
  try {
    auto cached = backend_->Get(key, timeout);
    if (!cached) {
      if (observability_) {
        observability_->RecordCacheMiss();
      }
      return std::nullopt;
    }
    std::vector<HistoryPoint> history;
    for (const auto& item : nlohmann::json::parse(*cached)) {
      history.push_back(HistoryPointFromJson(item));
    }
    if (observability_) {
      observability_->RecordCacheHit();
    }
    return history;
  } catch (const CacheBackendError& e) {
    LogBackendFailure("get", key, e);
  } catch (const nlohmann::json::exception& e) {
    LogBackendFailure("decode", key, e);
  }
  return std::nullopt;
}

void CacheLayer::PutPlayerHistory(std::int64_t player_id, const ScopeParams& params,
                                  const std::vector<HistoryPoint>& history, std::chrono::milliseconds timeout) {
  if (!flags_.cache_enabled || !backend_ || history.empty()) {
    return;
  }
  nlohmann::json payload = nlohmann::json::array();
  for (const auto& point : history) {
    payload.push_back(HistoryPointToJson(point));
  }
  const auto key = PlayerHistoryKey(player_id, params);
  try {
    backend_->Set(key, payload.dump(), std::chrono::seconds(ttl_.history_seconds), timeout);
  } catch (const CacheBackendError& e) {
    LogBackendFailure("set", key, e);
  }
}

bool CacheLayer::InvalidatePlayerHistory(std::int64_t player_id, const ScopeParams& params,
                                         std::chrono::milliseconds timeout) {
  if (!flags_.cache_enabled || !backend_) {
    return false;
  }
  const auto key = PlayerHistoryKey(player_id, params);
  try {
    backend_->Delete(key, timeout);
  } catch (const CacheBackendError& e) {
    LogBackendFailure("delete", key, e);
    return false;
  }
  return true;
}

void CacheLayer::LogBackendFailure(const std::string& op, const std::string& key, const std::exception& e) const {
  if (!observability_) {
    return;
  }
  observability_->RecordCacheError();
  LogContext ctx;
  ctx.name = "leaderboard.cache.error";
  ctx.level = LogLevel::kWarn;
  ctx.fields = {{"op", op}, {"key", key}, {"error", e.what()}};
  observability_->Log(ctx);
}

void CacheLayer::LogRead(const ScopeParams& params, const std::string& source, std::size_t count) const {
  if (!observability_) {
    return;
  }
  LogContext ctx;
  ctx.name = "leaderboard.read";
  ctx.level = LogLevel::kDebug;
  ctx.tournament_id = params.tournament_id;
  ctx.fields = {{"scope", ScopeName(params.scope)}, {"source", source}, {"count", count}};
  observability_->Log(ctx);
}

}  // namespace leaderboard
