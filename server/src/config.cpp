/*
 * 설명: 환경 변수에서 서버/DB/캐시/스냅샷 설정과 기능 플래그를 읽는다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "leaderboard/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace leaderboard {
namespace {
std::string Trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}
}  // namespace

bool ParseBoolFlag(const std::string& value, bool fallback) {
  std::string lowered = Trim(value);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return fallback;
}

std::vector<std::string> SplitList(const std::string& value, char delimiter) {
  std::vector<std::string> parts;
  std::istringstream iss(value);
  std::string part;
  while (std::getline(iss, part, delimiter)) {
    part = Trim(part);
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&get_env](const char* key, const char* def) -> std::size_t {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "app_db");
  cfg.db_connect_timeout_seconds = static_cast<unsigned int>(get_size("DB_CONNECT_TIMEOUT_SECONDS", "2"));
  cfg.db_query_timeout_seconds = static_cast<unsigned int>(get_size("DB_QUERY_TIMEOUT_SECONDS", "2"));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ops_token = get_env("OPS_TOKEN", "");

  cfg.flags.compute_enabled = ParseBoolFlag(get_env("LEADERBOARDS_COMPUTE_ENABLED", "true"), true);
  cfg.flags.cache_enabled = ParseBoolFlag(get_env("LEADERBOARDS_CACHE_ENABLED", "true"), true);
  cfg.flags.api_enabled = ParseBoolFlag(get_env("LEADERBOARDS_API_ENABLED", "true"), true);

  cfg.cache_ttl.tournament_seconds = get_size("CACHE_TTL_TOURNAMENT_SECONDS", "300");
  cfg.cache_ttl.season_seconds = get_size("CACHE_TTL_SEASON_SECONDS", "3600");
  cfg.cache_ttl.all_time_seconds = get_size("CACHE_TTL_ALL_TIME_SECONDS", "86400");
  cfg.cache_ttl.history_seconds = get_size("CACHE_TTL_HISTORY_SECONDS", "3600");
  cfg.cache_timeout_ms = get_size("CACHE_TIMEOUT_MS", "50");
  cfg.cache_max_entries = get_size("CACHE_MAX_ENTRIES", "1000");

  cfg.scoring_tables_path = get_env("SCORING_TABLES_PATH", "");
  cfg.snapshot_scopes = SplitList(get_env("SNAPSHOT_SCOPES", "all_time"), ',');
  cfg.snapshot_interval_seconds = get_size("SNAPSHOT_INTERVAL_SECONDS", "86400");
  cfg.snapshot_retention_days = get_size("SNAPSHOT_RETENTION_DAYS", "365");
  return cfg;
}

}  // namespace leaderboard
