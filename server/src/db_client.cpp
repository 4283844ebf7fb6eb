/*
 * 설명: MariaDB 연결과 재시도 로직, 결과 행 변환을 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/snapshot_upsert_it_test.cpp
 */
#include "leaderboard/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace leaderboard {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;

struct ResultFreer {
  void operator()(MYSQL_RES* res) const { mysql_free_result(res); }
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::ConnectionPtr MariaDbClient::Connect() const {
  ConnectionPtr conn(mysql_init(nullptr));
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout_seconds);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &config_.query_timeout_seconds);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &config_.query_timeout_seconds);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  std::string lock_wait = "SET SESSION innodb_lock_wait_timeout=" + std::to_string(config_.query_timeout_seconds) + ";";
  if (mysql_query(conn.get(), lock_wait.c_str()) != 0) {
    RaiseError(conn.get(), "락 대기 타임아웃 설정 실패");
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    ConnectionPtr conn;
    try {
      conn = Connect();
      mysql_autocommit(conn.get(), 0);
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(conn.get());
      if (commit) {
        if (mysql_commit(conn.get()) != 0) {
          RaiseError(conn.get(), "커밋 실패");
        }
      } else {
        mysql_rollback(conn.get());
      }
      return commit;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_rollback(conn.get());
      }
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    } catch (...) {
      if (conn) {
        mysql_rollback(conn.get());
      }
      throw;
    }
  }
  return false;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    try {
      ConnectionPtr conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      work(conn.get());
      return;
    } catch (const DbException& ex) {
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    }
  }
}

std::vector<DbRow> MariaDbClient::QueryRows(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  std::unique_ptr<MYSQL_RES, ResultFreer> res(mysql_store_result(conn));
  if (!res) {
    if (mysql_field_count(conn) == 0) {
      return {};
    }
    RaiseError(conn, ctx + " 결과 없음");
  }
  std::vector<DbRow> rows;
  unsigned int fields = mysql_num_fields(res.get());
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(res.get())) != nullptr) {
    DbRow values;
    values.reserve(fields);
    for (unsigned int i = 0; i < fields; ++i) {
      values.push_back(row[i] ? std::optional<std::string>(row[i]) : std::nullopt);
    }
    rows.push_back(std::move(values));
  }
  return rows;
}

unsigned long long MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  return mysql_affected_rows(conn);
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  bool retryable = IsRetryable(code);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, retryable);
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 25);
  std::size_t delay_ms = base_ms + static_cast<std::size_t>(dist(gen));
  std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace leaderboard
