#include <gtest/gtest.h>

#include "leaderboard/api_response.hpp"

using namespace leaderboard;

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"]["detail"].is_null());
}

TEST(JsonEnvelopeTest, ErrorDetailIsPassedThrough) {
  auto env = MakeErrorEnvelope("internal_error", "실패", {{"dbCode", 2013}, {"retryable", true}});
  EXPECT_EQ(env["error"]["detail"]["dbCode"], 2013);
  EXPECT_TRUE(env["error"]["detail"]["retryable"].get<bool>());
}

TEST(JsonEnvelopeTest, PageCarriesScopeAndMetadata) {
  LeaderboardPage page;
  page.params = ScopeParams::Season("2025_S1", std::string("valorant"));
  page.total = 12;
  LeaderboardEntry entry;
  entry.rank = 4;
  entry.player_id = 7;
  entry.points = 320;
  entry.wins = 3;
  entry.losses = 1;
  entry.win_rate = 0.75;
  page.entries.push_back(entry);
  page.metadata.count = 1;
  page.metadata.cache_hit = true;
  page.metadata.cached_at = "2025-06-01T00:00:00Z";

  auto json = PageToJson(page);
  EXPECT_EQ(json["scope"], "season");
  ASSERT_EQ(json["entries"].size(), 1u);
  EXPECT_EQ(json["entries"][0]["rank"], 4);
  EXPECT_EQ(json["entries"][0]["playerId"], 7);
  EXPECT_TRUE(json["entries"][0]["teamId"].is_null());
  EXPECT_EQ(json["metadata"]["count"], 1);
  EXPECT_EQ(json["metadata"]["total"], 12);
  EXPECT_TRUE(json["metadata"]["cacheHit"].get<bool>());
  EXPECT_TRUE(json["metadata"]["computationEnabled"].get<bool>());
  EXPECT_EQ(json["metadata"]["seasonId"], "2025_S1");
  EXPECT_EQ(json["metadata"]["gameCode"], "valorant");
  EXPECT_EQ(json["metadata"]["cachedAt"], "2025-06-01T00:00:00Z");
  EXPECT_FALSE(json["metadata"].contains("queriedAt"));
}

TEST(JsonEnvelopeTest, SnapshotReportIncludesDeltas) {
  SnapshotReport report;
  report.params = ScopeParams::Tournament(501);
  report.date = "2025-06-02";
  report.rows_written = 2;
  RankDelta delta;
  delta.team_id = 101;
  delta.previous_rank = 3;
  delta.current_rank = 1;
  delta.rank_change = -2;
  report.deltas.push_back(delta);

  auto json = SnapshotReportToJson(report);
  EXPECT_EQ(json["tournamentId"], 501);
  EXPECT_EQ(json["rowsWritten"], 2);
  EXPECT_EQ(json["deltas"][0]["rankChange"], -2);
  EXPECT_EQ(json["deltas"][0]["previousRank"], 3);
  EXPECT_TRUE(json["error"].is_null());
}
