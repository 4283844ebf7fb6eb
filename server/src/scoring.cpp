/*
 * 설명: 점수표 검증, 순위 점수/승리 보너스 계산, JSON 점수표 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/scoring_engine_test.cpp
 */
#include "leaderboard/scoring.hpp"

#include <fstream>

#include "leaderboard/errors.hpp"

namespace leaderboard {

ScoringTable::ScoringTable(std::string name, std::vector<ScoringTier> tiers, int win_bonus_per_win)
    : name_(std::move(name)), tiers_(std::move(tiers)), win_bonus_per_win_(win_bonus_per_win) {
  Validate();
}

ScoringTable ScoringTable::Default() {
  return ScoringTable("default", {{1, 1, 1000}, {2, 2, 750}, {3, 3, 500}, {4, 8, 250}, {9, 16, 100}, {17, 0, 25}});
}

void ScoringTable::Validate() const {
  auto fail = [this](const std::string& reason) {
    throw ConfigurationError("점수표 '" + name_ + "' 검증 실패: " + reason);
  };
  if (tiers_.empty()) {
    fail("구간이 비어 있습니다");
  }
  if (win_bonus_per_win_ < 0) {
    fail("winBonus는 음수일 수 없습니다");
  }
  int expected_first = 1;
  for (std::size_t i = 0; i < tiers_.size(); ++i) {
    const auto& tier = tiers_[i];
    std::string where = "구간 " + std::to_string(i + 1);
    if (tier.first != expected_first) {
      fail(where + "이 " + std::to_string(expected_first) + "위에서 시작하지 않습니다");
    }
    bool open_ended = tier.last == 0;
    if (open_ended && i + 1 != tiers_.size()) {
      fail(where + "은 상한이 없지만 마지막 구간이 아닙니다");
    }
    if (!open_ended && tier.last < tier.first) {
      fail(where + "의 last가 first보다 작습니다");
    }
    if (i > 0) {
      int previous = tiers_[i - 1].points;
      if (tier.points > previous) {
        fail(where + "의 점수가 이전 구간보다 큽니다");
      }
      if (previous - tier.points > previous) {
        fail(where + "의 하락 폭이 이전 구간 점수를 넘습니다");
      }
    }
    expected_first = tier.last + 1;
  }
  if (tiers_.back().last != 0) {
    fail("마지막 구간은 상한이 없어야 합니다(last=0)");
  }
}

int ScoringTable::PlacementPoints(int placement) const {
  if (placement <= 0) {
    return 0;
  }
  for (const auto& tier : tiers_) {
    if (placement >= tier.first && (tier.last == 0 || placement <= tier.last)) {
      return tier.points;
    }
  }
  return tiers_.back().points;
}

int PlacementPoints(int placement) {
  static const ScoringTable kDefault = ScoringTable::Default();
  return kDefault.PlacementPoints(placement);
}

int WinBonus(int wins) { return wins * 10; }

ScoringRegistry::ScoringRegistry() : default_table_(ScoringTable::Default()) {}

void ScoringRegistry::Register(const std::string& key, ScoringTable table) {
  tables_.insert_or_assign(key, std::move(table));
}

const ScoringTable& ScoringRegistry::Resolve(const std::string& format, const std::string& game_code) const {
  if (!format.empty()) {
    auto it = tables_.find(format);
    if (it != tables_.end()) {
      return it->second;
    }
  }
  if (!game_code.empty()) {
    auto it = tables_.find(game_code);
    if (it != tables_.end()) {
      return it->second;
    }
  }
  return default_table_;
}

ScoringRegistry LoadScoringRegistry(const nlohmann::json& config) {
  ScoringRegistry registry;
  if (!config.contains("tables")) {
    return registry;
  }
  const auto& tables = config["tables"];
  if (!tables.is_object()) {
    throw ConfigurationError("점수표 설정의 tables는 객체여야 합니다");
  }
  for (auto it = tables.begin(); it != tables.end(); ++it) {
    const auto& body = it.value();
    if (!body.contains("tiers") || !body["tiers"].is_array()) {
      throw ConfigurationError("점수표 '" + it.key() + "'에 tiers 배열이 없습니다");
    }
    std::vector<ScoringTier> tiers;
    try {
      for (const auto& tier : body["tiers"]) {
        tiers.push_back(ScoringTier{tier.at("first").get<int>(), tier.value("last", 0), tier.at("points").get<int>()});
      }
    } catch (const nlohmann::json::exception& ex) {
      throw ConfigurationError("점수표 '" + it.key() + "' 구간 형식 오류: " + ex.what());
    }
    registry.Register(it.key(), ScoringTable(it.key(), std::move(tiers), body.value("winBonus", 10)));
  }
  return registry;
}

ScoringRegistry LoadScoringRegistryFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("점수표 파일을 열 수 없습니다: " + path);
  }
  nlohmann::json config;
  try {
    in >> config;
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigurationError("점수표 파일 JSON 파싱 실패: " + std::string(ex.what()));
  }
  return LoadScoringRegistry(config);
}

}  // namespace leaderboard
