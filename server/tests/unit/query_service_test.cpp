#include <memory>
#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include "fakes/in_memory_stores.hpp"
#include "leaderboard/api_response.hpp"
#include "leaderboard/errors.hpp"
#include "leaderboard/query_service.hpp"

using namespace leaderboard;
using namespace leaderboard::testing_support;
using namespace std::chrono_literals;

namespace {

class QueryServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    records_ = std::make_shared<FakeRecordStore>();
    snapshots_ = std::make_shared<FakeSnapshotStore>();
    backend_ = std::make_shared<SpyCacheBackend>();
    observability_ = std::make_shared<Observability>(LogLevel::kError, &log_);
    auto computer =
        std::make_shared<LeaderboardComputer>(records_, std::make_shared<ScoringRegistry>(), observability_);
    cache_ = std::make_shared<CacheLayer>(backend_, computer, FeatureFlags{}, CacheTtlConfig{}, observability_);
    service_ = std::make_shared<QueryService>(cache_, snapshots_, 50ms);
    SeedEightTeamTournament(*records_, 501);
  }

  void AddHistoryRow(const std::string& date, int rank, int points) {
    snapshots_->Insert(SnapshotRow{date, ScopeParams::AllTime(), 7, std::nullopt, rank, points});
  }

  std::ostringstream log_;
  std::shared_ptr<FakeRecordStore> records_;
  std::shared_ptr<FakeSnapshotStore> snapshots_;
  std::shared_ptr<SpyCacheBackend> backend_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<CacheLayer> cache_;
  std::shared_ptr<QueryService> service_;
};

TEST_F(QueryServiceTest, PaginationReturnsRanksFourToSix) {
  auto page = service_->List(ScopeParams::Tournament(501), 3, 3);
  EXPECT_EQ(page.total, 8u);
  ASSERT_EQ(page.entries.size(), 3u);
  EXPECT_EQ(page.entries[0].rank, 4);
  EXPECT_EQ(page.entries[1].rank, 5);
  EXPECT_EQ(page.entries[2].rank, 6);
  EXPECT_EQ(page.metadata.count, 3u);
}

TEST_F(QueryServiceTest, PagesCoverEveryRankOnce) {
  int expected = 1;
  for (int offset = 0; offset < 8; offset += 3) {
    auto page = service_->List(ScopeParams::Tournament(501), 3, offset);
    for (const auto& entry : page.entries) {
      EXPECT_EQ(entry.rank, expected++);
    }
  }
  EXPECT_EQ(expected, 9);
}

TEST_F(QueryServiceTest, OffsetPastEndGivesEmptyPage) {
  auto page = service_->List(ScopeParams::Tournament(501), 10, 50);
  EXPECT_TRUE(page.entries.empty());
  EXPECT_EQ(page.total, 8u);
}

TEST_F(QueryServiceTest, RejectsOutOfRangeLimitAndOffset) {
  EXPECT_THROW(service_->List(ScopeParams::Tournament(501), 0, 0), std::out_of_range);
  EXPECT_THROW(service_->List(ScopeParams::Tournament(501), 101, 0), std::out_of_range);
  EXPECT_THROW(service_->List(ScopeParams::Tournament(501), 10, -1), std::out_of_range);
}

TEST_F(QueryServiceTest, CachedOutOfOrderEntriesAreSortedByRank) {
  nlohmann::json payload{{"entries", nlohmann::json::array()}, {"cachedAt", "2025-06-01T00:00:00Z"}};
  for (int rank : {3, 1, 2}) {
    LeaderboardEntry entry;
    entry.rank = rank;
    entry.player_id = rank * 10;
    payload["entries"].push_back(EntryToJson(entry));
  }
  backend_->Inner().Set("lb:all_time:ALL", payload.dump(), 60s, 50ms);

  auto page = service_->List(ScopeParams::AllTime(), 10, 0);
  ASSERT_EQ(page.entries.size(), 3u);
  EXPECT_TRUE(page.metadata.cache_hit);
  EXPECT_EQ(page.entries[0].rank, 1);
  EXPECT_EQ(page.entries[1].rank, 2);
  EXPECT_EQ(page.entries[2].rank, 3);
}

TEST_F(QueryServiceTest, ResponseEntriesContainNoPii) {
  auto page = service_->List(ScopeParams::Tournament(501), 50, 0);
  auto json = PageToJson(page);
  for (const auto& entry : json["entries"]) {
    EXPECT_FALSE(entry.contains("username"));
    EXPECT_FALSE(entry.contains("email"));
    EXPECT_FALSE(entry.contains("displayName"));
    EXPECT_FALSE(entry.contains("name"));
  }
}

TEST_F(QueryServiceTest, FindPlayerRank) {
  auto season = ScopeParams::Season("2025_S1");
  records_->AddStanding(season, Standing(1, 100, 1, 0, "2025-01-01T00:00:00Z"));
  records_->AddStanding(season, Standing(2, 300, 2, 0, "2025-01-01T00:00:00Z"));
  auto found = service_->FindPlayerRank(season, 1);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->rank, 2);
  EXPECT_FALSE(service_->FindPlayerRank(season, 99).has_value());
}

TEST_F(QueryServiceTest, HistoryIsStrictlyIncreasingByDate) {
  AddHistoryRow("2025-06-03", 2, 300);
  AddHistoryRow("2025-06-01", 5, 100);
  AddHistoryRow("2025-06-02", 4, 200);
  auto history = service_->History(7, ScopeParams::AllTime(), 0);
  ASSERT_EQ(history.history.size(), 3u);
  EXPECT_EQ(history.history[0].date, "2025-06-01");
  EXPECT_EQ(history.history[1].date, "2025-06-02");
  EXPECT_EQ(history.history[2].date, "2025-06-03");
  for (std::size_t i = 1; i < history.history.size(); ++i) {
    EXPECT_LT(history.history[i - 1].date, history.history[i].date);
  }
}

TEST_F(QueryServiceTest, HistoryIsCachedAndWindowedByDays) {
  AddHistoryRow("2025-05-01", 9, 10);
  AddHistoryRow("2025-06-09", 4, 200);
  AddHistoryRow("2025-06-10", 3, 250);
  service_->SetTodayForTest("2025-06-10");

  auto windowed = service_->History(7, ScopeParams::AllTime(), 7);
  ASSERT_EQ(windowed.history.size(), 2u);
  EXPECT_FALSE(windowed.cache_hit);

  auto again = service_->History(7, ScopeParams::AllTime(), 0);
  EXPECT_TRUE(again.cache_hit);
  EXPECT_EQ(again.history.size(), 3u);
  EXPECT_EQ(snapshots_->HistoryCalls(), 1);
}

TEST_F(QueryServiceTest, HistoryIsEmptyWhenComputationDisabled) {
  AddHistoryRow("2025-06-01", 5, 100);
  AddHistoryRow("2025-06-02", 4, 200);
  FeatureFlags flags;
  flags.compute_enabled = false;
  auto computer =
      std::make_shared<LeaderboardComputer>(records_, std::make_shared<ScoringRegistry>(), observability_);
  auto disabled_cache = std::make_shared<CacheLayer>(backend_, computer, flags, CacheTtlConfig{}, observability_);
  QueryService disabled(disabled_cache, snapshots_, 50ms);

  auto history = disabled.History(7, ScopeParams::AllTime(), 0);
  EXPECT_TRUE(history.history.empty());
  EXPECT_FALSE(history.computation_enabled);
  EXPECT_EQ(snapshots_->HistoryCalls(), 0);
  EXPECT_EQ(backend_->Calls(), 0);
  EXPECT_FALSE(PlayerHistoryToJson(history)["computationEnabled"].get<bool>());

  auto enabled = service_->History(7, ScopeParams::AllTime(), 0);
  EXPECT_EQ(enabled.history.size(), 2u);
  EXPECT_TRUE(PlayerHistoryToJson(enabled)["computationEnabled"].get<bool>());
}

TEST_F(QueryServiceTest, AllGameCodeReadsCrossGameAggregateOnColdCache) {
  records_->AddStanding(ScopeParams::AllTime(), Standing(1, 900, 9, 1, "2025-01-01T00:00:00Z"));
  records_->AddStanding(ScopeParams::AllTime(), Standing(2, 700, 7, 3, "2025-01-02T00:00:00Z"));

  auto page = service_->List(ScopeParams::AllTime(std::string("ALL")), 10, 0);
  EXPECT_FALSE(page.metadata.cache_hit);
  ASSERT_EQ(page.entries.size(), 2u);
  EXPECT_EQ(page.entries[0].player_id.value(), 1);
  EXPECT_FALSE(page.params.game_code.has_value());
}

TEST_F(QueryServiceTest, UnknownPlayerHasEmptyHistory) {
  auto history = service_->History(12345, ScopeParams::AllTime(), 0);
  EXPECT_TRUE(history.history.empty());
}

}  // namespace
