#include <atomic>
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "leaderboard/errors.hpp"
#include "leaderboard/memory_cache_backend.hpp"

using leaderboard::CacheBackendError;
using leaderboard::MemoryCacheBackend;
using namespace std::chrono_literals;

TEST(MemoryCacheBackendTest, GetReturnsStoredValue) {
  MemoryCacheBackend cache(10);
  cache.Set("lb:all_time:ALL", "payload", 60s, 10ms);
  auto value = cache.Get("lb:all_time:ALL", 10ms);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "payload");
  EXPECT_FALSE(cache.Get("lb:missing", 10ms).has_value());
}

TEST(MemoryCacheBackendTest, EntriesExpireAfterTtl) {
  MemoryCacheBackend cache(10);
  auto now = MemoryCacheBackend::Clock::now();
  cache.SetClockForTest([&now]() { return now; });
  cache.Set("key", "v", 300s, 10ms);
  now += 299s;
  EXPECT_TRUE(cache.Get("key", 10ms).has_value());
  now += 2s;
  EXPECT_FALSE(cache.Get("key", 10ms).has_value());
  EXPECT_EQ(cache.Size(), 0u);
}

TEST(MemoryCacheBackendTest, EvictsLeastRecentlyUsed) {
  MemoryCacheBackend cache(2);
  cache.Set("a", "1", 60s, 10ms);
  cache.Set("b", "2", 60s, 10ms);
  ASSERT_TRUE(cache.Get("a", 10ms).has_value());
  cache.Set("c", "3", 60s, 10ms);
  EXPECT_TRUE(cache.Get("a", 10ms).has_value());
  EXPECT_FALSE(cache.Get("b", 10ms).has_value());
  EXPECT_TRUE(cache.Get("c", 10ms).has_value());
  EXPECT_EQ(cache.Evictions(), 1u);
}

TEST(MemoryCacheBackendTest, DeleteRemovesKey) {
  MemoryCacheBackend cache(4);
  cache.Set("a", "1", 60s, 10ms);
  cache.Delete("a", 10ms);
  cache.Delete("never-set", 10ms);
  EXPECT_FALSE(cache.Get("a", 10ms).has_value());
}

TEST(MemoryCacheBackendTest, UnavailableBackendThrows) {
  MemoryCacheBackend cache(4);
  cache.SetUnavailableForTest(true);
  EXPECT_THROW(cache.Get("a", 10ms), CacheBackendError);
  EXPECT_THROW(cache.Set("a", "1", 60s, 10ms), CacheBackendError);
  EXPECT_THROW(cache.Delete("a", 10ms), CacheBackendError);
}

TEST(MemoryCacheBackendTest, LockTimeoutThrows) {
  MemoryCacheBackend cache(4);
  std::atomic<bool> inside{false};
  std::atomic<bool> release{false};
  // 시계 콜백 안에서 잠금을 오래 잡아 다른 스레드의 타임아웃을 유발한다.
  cache.SetClockForTest([&]() {
    inside = true;
    while (!release.load()) {
      std::this_thread::sleep_for(1ms);
    }
    return MemoryCacheBackend::Clock::now();
  });
  std::thread holder([&]() { cache.Set("a", "1", 60s, 100ms); });
  while (!inside.load()) {
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_THROW(cache.Get("a", 5ms), CacheBackendError);
  release = true;
  holder.join();
}
