/*
 * 설명: MariaDB 연결과 재시도, 쿼리 실행 헬퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: tests/it/mariadb_repository_it_test.cpp
 */
#include "warden/db_client.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace warden {
namespace {
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr std::size_t kMaxBackoffMs = 800;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {
  if (config_.max_attempts == 0) {
    config_.max_attempts = 1;
  }
}

MariaDbClient::Connection MariaDbClient::Connect() const {
  Connection conn(mysql_init(nullptr));
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  const unsigned int timeout = config_.connect_timeout_seconds;
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &timeout);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &timeout);
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  if (mysql_set_character_set(conn.get(), "utf8mb4") != 0) {
    RaiseError(conn.get(), "문자셋 설정 실패");
  }
  // crosscheck의 SELECT ... FOR UPDATE가 오래 막히지 않도록 락 대기를 짧게 둔다.
  const std::string lock_wait =
      "SET SESSION innodb_lock_wait_timeout=" + std::to_string(config_.lock_wait_timeout_seconds) + ";";
  if (mysql_query(conn.get(), lock_wait.c_str()) != 0) {
    RaiseError(conn.get(), "락 대기 타임아웃 설정 실패");
  }
  return conn;
}

bool MariaDbClient::RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    Connection conn;
    try {
      conn = Connect();
      if (transactional) {
        mysql_autocommit(conn.get(), 0);
      }
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      const bool commit = work(conn.get());
      if (transactional) {
        if (!commit) {
          mysql_rollback(conn.get());
        } else if (mysql_commit(conn.get()) != 0) {
          RaiseError(conn.get(), "커밋 실패");
        }
      }
      return commit;
    } catch (const DbException& ex) {
      if (conn && transactional) {
        mysql_rollback(conn.get());
      }
      if (!ex.retryable || attempt >= config_.max_attempts) {
        throw;
      }
      if (retry_listener_) {
        retry_listener_(attempt, ex);
      }
    }
    // 연결은 백오프 전에 닫는다.
    conn.reset();
    Backoff(attempt);
  }
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  return RunWithRetry(true, work);
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  RunWithRetry(false, [&](MYSQL* conn) {
    work(conn);
    return true;
  });
}

bool MariaDbClient::Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    RaiseError(conn, ctx);
  }
  return true;
}

void MariaDbClient::Query(MYSQL* conn, const std::string& sql, const std::string& ctx,
                          const std::function<void(MYSQL_ROW)>& on_row) const {
  if (mysql_query(conn, sql.c_str()) != 0) {
    RaiseError(conn, ctx);
  }
  MYSQL_RES* res = mysql_store_result(conn);
  if (!res) {
    RaiseError(conn, ctx + " (결과 없음)");
  }
  try {
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
      on_row(row);
    }
  } catch (...) {
    mysql_free_result(res);
    throw;
  }
  mysql_free_result(res);
}

std::int64_t MariaDbClient::LastInsertId(MYSQL* conn) const { return static_cast<std::int64_t>(mysql_insert_id(conn)); }

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

std::string MariaDbClient::Quote(MYSQL* conn, const std::string& value) const {
  return "'" + Escape(conn, value) + "'";
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
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<std::size_t> jitter(0, 25);
  const std::size_t shift = std::min<std::size_t>(attempt - 1, 4);
  const std::size_t base_ms = std::min(kMaxBackoffMs, static_cast<std::size_t>(50) << shift);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + jitter(gen)));
}

void MariaDbClient::SetRetryListener(DbRetryListener listener) { retry_listener_ = std::move(listener); }

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace warden
