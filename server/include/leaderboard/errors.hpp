/*
 * 설명: 리더보드 엔진의 오류 분류(설정 오류, 캐시 백엔드 오류)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <stdexcept>
#include <string>

namespace leaderboard {

// 잘못된 스코프/누락된 파라미터/잘못된 점수표. HTTP 400으로 변환된다.
class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& message) : std::invalid_argument(message) {}
};

// 캐시 백엔드 장애 또는 타임아웃. 호출자에게 노출하지 않고 직접 계산으로 대체한다.
class CacheBackendError : public std::runtime_error {
 public:
  explicit CacheBackendError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace leaderboard
