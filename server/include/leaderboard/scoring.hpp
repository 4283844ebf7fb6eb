/*
 * 설명: 순위(placement)와 승리 수를 점수로 바꾸는 점수표와 게임/포맷별 점수표 레지스트리를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/scoring_engine_test.cpp
 */
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace leaderboard {

struct ScoringTier {
  int first;
  // 0이면 상한이 없는 마지막 구간
  int last;
  int points;
};

class ScoringTable {
 public:
  // 구간 불변식을 검사하고 위반 시 ConfigurationError를 던진다.
  ScoringTable(std::string name, std::vector<ScoringTier> tiers, int win_bonus_per_win = 10);

  static ScoringTable Default();

  int PlacementPoints(int placement) const;
  int WinBonus(int wins) const { return wins * win_bonus_per_win_; }

  const std::string& Name() const { return name_; }
  const std::vector<ScoringTier>& Tiers() const { return tiers_; }

 private:
  void Validate() const;

  std::string name_;
  std::vector<ScoringTier> tiers_;
  int win_bonus_per_win_;
};

// 기본 점수표: 1위 1000, 2위 750, 3위 500, 4-8위 250, 9-16위 100, 17위 이하 25
int PlacementPoints(int placement);
int WinBonus(int wins);

class ScoringRegistry {
 public:
  ScoringRegistry();

  void Register(const std::string& key, ScoringTable table);
  // 포맷 → 게임 코드 → 기본 점수표 순서로 찾는다.
  const ScoringTable& Resolve(const std::string& format, const std::string& game_code) const;
  std::size_t Size() const { return tables_.size(); }

 private:
  ScoringTable default_table_;
  std::unordered_map<std::string, ScoringTable> tables_;
};

// {"tables": {"battle_royale": {"winBonus": 0, "tiers": [{"first":1,"last":1,"points":12}, ...]}}}
ScoringRegistry LoadScoringRegistry(const nlohmann::json& config);
ScoringRegistry LoadScoringRegistryFromFile(const std::string& path);

}  // namespace leaderboard
