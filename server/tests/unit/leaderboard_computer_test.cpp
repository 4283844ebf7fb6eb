#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "fakes/in_memory_stores.hpp"
#include "leaderboard/errors.hpp"
#include "leaderboard/leaderboard_computer.hpp"

using namespace leaderboard;
using namespace leaderboard::testing_support;

namespace {

class LeaderboardComputerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    records_ = std::make_shared<FakeRecordStore>();
    observability_ = std::make_shared<Observability>(LogLevel::kDebug, &log_);
    computer_ = std::make_shared<LeaderboardComputer>(records_, std::make_shared<ScoringRegistry>(), observability_);
  }

  std::ostringstream log_;
  std::shared_ptr<FakeRecordStore> records_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<LeaderboardComputer> computer_;
};

TEST_F(LeaderboardComputerTest, EightTeamScenario) {
  SeedEightTeamTournament(*records_, 501);
  auto entries = computer_->Compute(ScopeParams::Tournament(501));
  ASSERT_EQ(entries.size(), 8u);

  EXPECT_EQ(entries[0].team_id.value(), 101);
  EXPECT_EQ(entries[0].rank, 1);
  EXPECT_EQ(entries[0].points, 1050);
  EXPECT_EQ(entries[0].wins, 5);

  // placement 2: B(2승)가 먼저, 0승 팀은 등록 시각 순(F 09:01, C 09:03)
  EXPECT_EQ(entries[1].team_id.value(), 102);
  EXPECT_EQ(entries[1].points, 770);
  EXPECT_EQ(entries[2].team_id.value(), 106);
  EXPECT_EQ(entries[3].team_id.value(), 103);
  // placement 3: E 09:02, D 09:04
  EXPECT_EQ(entries[4].team_id.value(), 105);
  EXPECT_EQ(entries[5].team_id.value(), 104);
  EXPECT_EQ(entries[4].points, 500);
}

TEST_F(LeaderboardComputerTest, RanksAreContiguousFromOne) {
  SeedEightTeamTournament(*records_, 501);
  auto entries = computer_->Compute(ScopeParams::Tournament(501));
  for (std::size_t i = 0; i < entries.size(); ++i) {
    EXPECT_EQ(entries[i].rank, static_cast<int>(i + 1));
  }
}

TEST_F(LeaderboardComputerTest, DeterministicAcrossCalls) {
  SeedEightTeamTournament(*records_, 501);
  auto first = computer_->Compute(ScopeParams::Tournament(501));
  auto second = computer_->Compute(ScopeParams::Tournament(501));
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].team_id, second[i].team_id);
    EXPECT_EQ(first[i].points, second[i].points);
    EXPECT_EQ(first[i].last_updated, second[i].last_updated);
  }
}

TEST_F(LeaderboardComputerTest, MissingTournamentGivesEmptyList) {
  EXPECT_TRUE(computer_->Compute(ScopeParams::Tournament(999)).empty());
}

TEST_F(LeaderboardComputerTest, TournamentWithoutPlacementsGivesEmptyList) {
  records_->AddTournament(TournamentInfo{7, "valorant", "single_elimination", true});
  EXPECT_TRUE(computer_->Compute(ScopeParams::Tournament(7)).empty());
}

TEST_F(LeaderboardComputerTest, DeletedSubjectsAreSkippedAndLogged) {
  records_->AddTournament(TournamentInfo{8, "valorant", "single_elimination", false});
  auto deleted = Placement(std::nullopt, 201, 1, "2025-05-01T09:00:00Z");
  deleted.subject_deleted = true;
  records_->AddPlacement(8, deleted);
  records_->AddPlacement(8, Placement(std::nullopt, 202, 2, "2025-05-01T09:01:00Z"));

  auto entries = computer_->Compute(ScopeParams::Tournament(8));
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0].team_id.value(), 202);
  EXPECT_EQ(entries[0].rank, 1);
  EXPECT_NE(log_.str().find("leaderboard.compute.skipped_deleted"), std::string::npos);
}

TEST_F(LeaderboardComputerTest, InactiveRegistrationsDoNotConsumeRanks) {
  records_->AddTournament(TournamentInfo{9, "valorant", "single_elimination", false});
  auto inactive = Placement(11, std::nullopt, 1, "2025-05-01T09:00:00Z");
  inactive.is_active = false;
  records_->AddPlacement(9, inactive);
  records_->AddPlacement(9, Placement(12, std::nullopt, 2, "2025-05-01T09:01:00Z"));
  records_->AddPlacement(9, Placement(13, std::nullopt, 3, "2025-05-01T09:02:00Z"));

  auto entries = computer_->Compute(ScopeParams::Tournament(9));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].player_id.value(), 12);
  EXPECT_EQ(entries[0].rank, 1);
  EXPECT_EQ(entries[1].rank, 2);
}

TEST_F(LeaderboardComputerTest, UsesTableResolvedForFormat) {
  auto registry = std::make_shared<ScoringRegistry>();
  registry->Register("battle_royale", ScoringTable("battle_royale", {{1, 1, 12}, {2, 2, 9}, {3, 0, 0}}, 0));
  LeaderboardComputer computer(records_, registry, observability_);
  records_->AddTournament(TournamentInfo{10, "pubg", "battle_royale", false});
  records_->AddPlacement(10, Placement(21, std::nullopt, 1, "2025-05-01T09:00:00Z"));
  records_->AddPlacement(10, Placement(22, std::nullopt, 2, "2025-05-01T09:01:00Z"));
  records_->AddOutcome(10, MatchOutcome{21, std::nullopt, 22, std::nullopt});

  auto entries = computer.Compute(ScopeParams::Tournament(10));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].points, 12);
  EXPECT_EQ(entries[1].points, 9);
  EXPECT_EQ(entries[1].losses, 1);
  EXPECT_DOUBLE_EQ(entries[1].win_rate, 0.0);
}

TEST_F(LeaderboardComputerTest, SeasonSortsByPointsThenWinsThenRegistration) {
  auto season = ScopeParams::Season("2025_S1");
  records_->AddStanding(season, Standing(1, 500, 3, 2, "2025-01-03T00:00:00Z"));
  records_->AddStanding(season, Standing(2, 800, 1, 4, "2025-01-05T00:00:00Z"));
  records_->AddStanding(season, Standing(3, 500, 5, 0, "2025-01-04T00:00:00Z"));
  records_->AddStanding(season, Standing(4, 500, 3, 1, "2025-01-01T00:00:00Z"));

  auto entries = computer_->Compute(season);
  ASSERT_EQ(entries.size(), 4u);
  EXPECT_EQ(entries[0].player_id.value(), 2);
  EXPECT_EQ(entries[1].player_id.value(), 3);
  EXPECT_EQ(entries[2].player_id.value(), 4);
  EXPECT_EQ(entries[3].player_id.value(), 1);
  EXPECT_DOUBLE_EQ(entries[3].win_rate, 0.6);
}

TEST_F(LeaderboardComputerTest, SeasonWithoutIdRaises) {
  ScopeParams params;
  params.scope = Scope::kSeason;
  EXPECT_THROW(computer_->Compute(params), ConfigurationError);
}

TEST_F(LeaderboardComputerTest, RecordStoreFailurePropagates) {
  records_->SetFailing(true);
  EXPECT_THROW(computer_->Compute(ScopeParams::AllTime()), DbException);
}

}  // namespace
