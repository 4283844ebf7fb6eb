/*
 * 설명: 리더보드 캐시가 사용하는 키-값 백엔드 포트.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_cache_backend_test.cpp, server/tests/unit/cache_layer_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace leaderboard {

// 모든 연산은 timeout 안에 끝나지 않거나 백엔드가 불가용하면 CacheBackendError를 던진다.
class CacheBackend {
 public:
  virtual ~CacheBackend() = default;

  virtual std::optional<std::string> Get(const std::string& key, std::chrono::milliseconds timeout) = 0;
  virtual void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl,
                   std::chrono::milliseconds timeout) = 0;
  virtual void Delete(const std::string& key, std::chrono::milliseconds timeout) = 0;
};

}  // namespace leaderboard
