/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/leaderboard_api_test.cpp
 */
#include <csignal>
#include <iostream>

#include "leaderboard/app.hpp"
#include "leaderboard/errors.hpp"

int main() {
  using namespace leaderboard;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 로드 실패: " << ex.what() << "\n";
    return 1;
  }

  try {
    ServerApp app(config);

    std::signal(SIGINT, [](int) {
      std::cout << "SIGINT 수신, 종료를 준비합니다\n";
    });

    app.Run();
  } catch (const ConfigurationError& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
