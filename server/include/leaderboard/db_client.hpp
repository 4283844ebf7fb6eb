/*
 * 설명: MariaDB 연결, 타임아웃, 트랜잭션 재시도 정책과 행 조회 헬퍼를 캡슐화한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/snapshot_upsert_it_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <mariadb/mysql.h>

namespace leaderboard {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  unsigned int connect_timeout_seconds{2};
  unsigned int query_timeout_seconds{2};
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

using DbRow = std::vector<std::optional<std::string>>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  std::vector<DbRow> QueryRows(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  unsigned long long Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const {
      if (conn) {
        mysql_close(conn);
      }
    }
  };
  using ConnectionPtr = std::unique_ptr<MYSQL, ConnectionCloser>;

  ConnectionPtr Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace leaderboard
