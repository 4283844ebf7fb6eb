/*
 * 설명: 타임드 뮤텍스로 보호되는 LRU + TTL 캐시 백엔드를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_cache_backend_test.cpp
 */
#include "leaderboard/memory_cache_backend.hpp"

#include <utility>

#include "leaderboard/errors.hpp"

namespace leaderboard {

MemoryCacheBackend::MemoryCacheBackend(std::size_t max_entries)
    : max_entries_(max_entries == 0 ? 1 : max_entries), now_([] { return Clock::now(); }) {}

std::unique_lock<std::timed_mutex> MemoryCacheBackend::Acquire(std::chrono::milliseconds timeout, const char* op) {
  if (unavailable_.load()) {
    throw CacheBackendError(std::string("캐시 백엔드를 사용할 수 없습니다: ") + op);
  }
  std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
  if (!lock.try_lock_for(timeout)) {
    throw CacheBackendError(std::string("캐시 백엔드 응답 시간 초과: ") + op);
  }
  return lock;
}

std::optional<std::string> MemoryCacheBackend::Get(const std::string& key, std::chrono::milliseconds timeout) {
  auto lock = Acquire(timeout, "get");
  auto it = index_.find(key);
  if (it == index_.end()) {
    return std::nullopt;
  }
  if (Now() >= it->second->expires_at) {
    lru_.erase(it->second);
    index_.erase(it);
    return std::nullopt;
  }
  lru_.splice(lru_.begin(), lru_, it->second);
  return it->second->value;
}

void MemoryCacheBackend::Set(const std::string& key, const std::string& value, std::chrono::seconds ttl,
                             std::chrono::milliseconds timeout) {
  auto lock = Acquire(timeout, "set");
  auto expires_at = Now() + ttl;
  auto it = index_.find(key);
  if (it != index_.end()) {
    it->second->value = value;
    it->second->expires_at = expires_at;
    lru_.splice(lru_.begin(), lru_, it->second);
    return;
  }
  lru_.push_front(Entry{key, value, expires_at});
  index_[key] = lru_.begin();
  EvictIfNeeded();
}

void MemoryCacheBackend::Delete(const std::string& key, std::chrono::milliseconds timeout) {
  auto lock = Acquire(timeout, "delete");
  auto it = index_.find(key);
  if (it == index_.end()) {
    return;
  }
  lru_.erase(it->second);
  index_.erase(it);
}

std::size_t MemoryCacheBackend::Size() const {
  std::lock_guard<std::timed_mutex> lock(mutex_);
  return index_.size();
}

void MemoryCacheBackend::SetClockForTest(std::function<Clock::time_point()> now) {
  std::lock_guard<std::timed_mutex> lock(mutex_);
  now_ = std::move(now);
}

void MemoryCacheBackend::EvictIfNeeded() {
  while (index_.size() > max_entries_) {
    index_.erase(lru_.back().key);
    lru_.pop_back();
    evictions_.fetch_add(1);
  }
}

MemoryCacheBackend::Clock::time_point MemoryCacheBackend::Now() const { return now_(); }

}  // namespace leaderboard
