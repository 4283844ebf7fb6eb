/*
 * 설명: 스코프 해석/검증과 엔트리 직렬화, 날짜 변환을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_types_test.cpp
 */
#include "leaderboard/leaderboard_types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "leaderboard/config.hpp"
#include "leaderboard/errors.hpp"

namespace leaderboard {
namespace {
constexpr const char* kAllGames = "ALL";

nlohmann::json OptionalId(const std::optional<std::int64_t>& id) {
  return id ? nlohmann::json(*id) : nlohmann::json(nullptr);
}

std::optional<std::int64_t> ReadOptionalId(const nlohmann::json& json, const char* key) {
  if (!json.contains(key) || json[key].is_null()) {
    return std::nullopt;
  }
  return json[key].get<std::int64_t>();
}

std::optional<std::int64_t> ParseInt64(const std::string& text) {
  try {
    std::size_t idx = 0;
    auto value = std::stoll(text, &idx);
    if (idx != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::int64_t ParseId(const std::string& text, const std::string& scope_text) {
  auto value = ParseInt64(text);
  if (!value) {
    throw ConfigurationError("tournament id가 숫자가 아닙니다: " + scope_text);
  }
  return *value;
}

std::tm ParseTm(const std::string& text, const char* format) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, format);
  if (iss.fail()) {
    throw ConfigurationError("날짜 형식이 올바르지 않습니다: " + text);
  }
  return tm;
}
}  // namespace

std::string ScopeName(Scope scope) {
  switch (scope) {
    case Scope::kTournament:
      return "tournament";
    case Scope::kSeason:
      return "season";
    case Scope::kAllTime:
      return "all_time";
  }
  return "all_time";
}

Scope ParseScope(const std::string& name) {
  if (name == "tournament") {
    return Scope::kTournament;
  }
  if (name == "season") {
    return Scope::kSeason;
  }
  if (name == "all_time") {
    return Scope::kAllTime;
  }
  throw ConfigurationError("알 수 없는 scope입니다: " + name + " (tournament, season, all_time 중 하나)");
}

std::optional<std::string> NormalizeGameCode(const std::optional<std::string>& game_code) {
  if (!game_code || game_code->empty() || *game_code == kAllGames) {
    return std::nullopt;
  }
  return game_code;
}

ScopeParams ScopeParams::Tournament(std::int64_t tournament_id) {
  ScopeParams params;
  params.scope = Scope::kTournament;
  params.tournament_id = tournament_id;
  return params;
}

ScopeParams ScopeParams::Season(const std::string& season_id, std::optional<std::string> game_code) {
  ScopeParams params;
  params.scope = Scope::kSeason;
  params.season_id = season_id;
  params.game_code = NormalizeGameCode(game_code);
  return params;
}

ScopeParams ScopeParams::AllTime(std::optional<std::string> game_code) {
  ScopeParams params;
  params.scope = Scope::kAllTime;
  params.game_code = NormalizeGameCode(game_code);
  return params;
}

void ValidateScopeParams(const ScopeParams& params) {
  if (params.scope == Scope::kSeason && (!params.season_id || params.season_id->empty())) {
    throw ConfigurationError("scope=season 요청에는 seasonId가 필요합니다");
  }
  if (params.scope == Scope::kTournament && !params.tournament_id) {
    throw ConfigurationError("scope=tournament 요청에는 tournamentId가 필요합니다");
  }
}

std::string ScopeKey(const ScopeParams& params) {
  ValidateScopeParams(params);
  std::string game = params.game_code && !params.game_code->empty() ? *params.game_code : kAllGames;
  switch (params.scope) {
    case Scope::kTournament:
      return "tournament:" + std::to_string(*params.tournament_id);
    case Scope::kSeason:
      return "season:" + *params.season_id + ":" + game;
    case Scope::kAllTime:
      return "all_time:" + game;
  }
  return "all_time:" + game;
}

ScopeParams ParseScopeSpec(const std::string& scope_text) {
  auto parts = SplitList(scope_text, ':');
  if (parts.empty()) {
    throw ConfigurationError("빈 스코프 설정입니다");
  }
  Scope scope = ParseScope(parts[0]);
  auto game_at = [&](std::size_t idx) -> std::optional<std::string> {
    if (parts.size() <= idx || parts[idx] == kAllGames) {
      return std::nullopt;
    }
    return parts[idx];
  };
  switch (scope) {
    case Scope::kTournament:
      if (parts.size() < 2) {
        throw ConfigurationError("tournament 스코프에는 id가 필요합니다: " + scope_text);
      }
      return ScopeParams::Tournament(ParseId(parts[1], scope_text));
    case Scope::kSeason:
      if (parts.size() < 2 || parts[1].empty()) {
        throw ConfigurationError("season 스코프에는 seasonId가 필요합니다: " + scope_text);
      }
      return ScopeParams::Season(parts[1], game_at(2));
    case Scope::kAllTime:
      return ScopeParams::AllTime(game_at(1));
  }
  return ScopeParams::AllTime();
}

double WinRate(int wins, int losses) {
  int games = wins + losses;
  if (games <= 0) {
    return 0.0;
  }
  return static_cast<double>(wins) / static_cast<double>(games);
}

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

std::chrono::system_clock::time_point ParseIsoString(const std::string& text) {
  std::tm tm = ParseTm(text, "%Y-%m-%dT%H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string ToDateString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d");
  return oss.str();
}

std::string ShiftDate(const std::string& date, int days) {
  std::tm tm = ParseTm(date, "%Y-%m-%d");
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  return ToDateString(tp + std::chrono::hours(24 * days));
}

nlohmann::json EntryToJson(const LeaderboardEntry& entry) {
  return nlohmann::json{{"rank", entry.rank},
                        {"playerId", OptionalId(entry.player_id)},
                        {"teamId", OptionalId(entry.team_id)},
                        {"points", entry.points},
                        {"wins", entry.wins},
                        {"losses", entry.losses},
                        {"winRate", entry.win_rate},
                        {"lastUpdated", ToIsoString(entry.last_updated)}};
}

LeaderboardEntry EntryFromJson(const nlohmann::json& json) {
  LeaderboardEntry entry;
  entry.rank = json.at("rank").get<int>();
  entry.player_id = ReadOptionalId(json, "playerId");
  entry.team_id = ReadOptionalId(json, "teamId");
  entry.points = json.at("points").get<int>();
  entry.wins = json.at("wins").get<int>();
  entry.losses = json.at("losses").get<int>();
  entry.win_rate = json.at("winRate").get<double>();
  entry.is_active = true;
  entry.last_updated = ParseIsoString(json.at("lastUpdated").get<std::string>());
  return entry;
}

nlohmann::json HistoryPointToJson(const HistoryPoint& point) {
  return nlohmann::json{{"date", point.date},
                        {"rank", point.rank},
                        {"points", point.points},
                        {"leaderboardType", point.leaderboard_type}};
}

HistoryPoint HistoryPointFromJson(const nlohmann::json& json) {
  return HistoryPoint{json.at("date").get<std::string>(), json.at("rank").get<int>(), json.at("points").get<int>(),
                      json.at("leaderboardType").get<std::string>()};
}

nlohmann::json DeltaToJson(const RankDelta& delta) {
  return nlohmann::json{{"playerId", OptionalId(delta.player_id)},
                        {"teamId", OptionalId(delta.team_id)},
                        {"previousRank", delta.previous_rank ? nlohmann::json(*delta.previous_rank) : nlohmann::json()},
                        {"currentRank", delta.current_rank},
                        {"rankChange", delta.rank_change},
                        {"points", delta.points}};
}

}  // namespace leaderboard
