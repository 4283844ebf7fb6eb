/*
 * 설명: 서버 환경설정 로딩과 기본값, 리더보드 기능 플래그를 정의한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/leaderboard_api_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace leaderboard {

struct FeatureFlags {
  bool compute_enabled{true};
  bool cache_enabled{true};
  bool api_enabled{true};
};

struct CacheTtlConfig {
  std::size_t tournament_seconds{300};
  std::size_t season_seconds{3600};
  std::size_t all_time_seconds{86400};
  std::size_t history_seconds{3600};
};

struct AppConfig {
  unsigned short port{8080};
  std::string db_host;
  unsigned short db_port{3306};
  std::string db_user;
  std::string db_password;
  std::string db_name;
  unsigned int db_connect_timeout_seconds{2};
  unsigned int db_query_timeout_seconds{2};
  std::string log_level{"info"};
  std::string ops_token;
  FeatureFlags flags;
  CacheTtlConfig cache_ttl;
  std::size_t cache_timeout_ms{50};
  std::size_t cache_max_entries{1000};
  std::string scoring_tables_path;
  // "all_time", "all_time:valorant", "season:2025_S1", "season:2025_S1:valorant" 형식
  std::vector<std::string> snapshot_scopes;
  std::size_t snapshot_interval_seconds{86400};
  std::size_t snapshot_retention_days{365};
};

AppConfig LoadConfigFromEnv();

bool ParseBoolFlag(const std::string& value, bool fallback);
std::vector<std::string> SplitList(const std::string& value, char delimiter);

}  // namespace leaderboard
