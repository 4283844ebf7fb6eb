/*
 * 설명: TTL 만료와 LRU 축출을 지원하는 프로세스 내 캐시 백엔드.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_cache_backend_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

#include "leaderboard/cache_backend.hpp"

namespace leaderboard {

class MemoryCacheBackend : public CacheBackend {
 public:
  using Clock = std::chrono::steady_clock;

  explicit MemoryCacheBackend(std::size_t max_entries = 1000);

  std::optional<std::string> Get(const std::string& key, std::chrono::milliseconds timeout) override;
  void Set(const std::string& key, const std::string& value, std::chrono::seconds ttl,
           std::chrono::milliseconds timeout) override;
  void Delete(const std::string& key, std::chrono::milliseconds timeout) override;

  std::size_t Size() const;
  std::uint64_t Evictions() const { return evictions_.load(); }

  // 테스트 전용: 만료 판정에 쓰는 시계를 교체한다.
  void SetClockForTest(std::function<Clock::time_point()> now);
  // 테스트 전용: true면 모든 연산이 CacheBackendError를 던진다.
  void SetUnavailableForTest(bool unavailable) { unavailable_.store(unavailable); }

 private:
  struct Entry {
    std::string key;
    std::string value;
    Clock::time_point expires_at;
  };
  using EntryList = std::list<Entry>;

  std::unique_lock<std::timed_mutex> Acquire(std::chrono::milliseconds timeout, const char* op);
  void EvictIfNeeded();
  Clock::time_point Now() const;

  std::size_t max_entries_;
  mutable std::timed_mutex mutex_;
  // 앞쪽이 가장 최근에 사용된 항목
  EntryList lru_;
  std::unordered_map<std::string, EntryList::iterator> index_;
  std::function<Clock::time_point()> now_;
  std::atomic<bool> unavailable_{false};
  std::atomic<std::uint64_t> evictions_{0};
};

}  // namespace leaderboard
