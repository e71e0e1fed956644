/*
 * 설명: MariaDB 연결, 쿼리 헬퍼, 트랜잭션 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace warden {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
  std::size_t max_attempts = 3;
  unsigned int connect_timeout_seconds = 2;
  unsigned int lock_wait_timeout_seconds = 2;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

constexpr unsigned int kDuplicateEntry = 1062;

// 재시도 직전에 시도 번호와 원인 예외로 호출된다.
using DbRetryListener = std::function<void(std::size_t attempt, const DbException& cause)>;

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work가 true를 반환하면 커밋, false면 롤백한다. 일시 오류는 새 연결로 다시 시도한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  // 실패 시 DbException을 던진다. 중복 키 위반은 false를 반환한다.
  bool Execute(MYSQL* conn, const std::string& sql, const std::string& ctx) const;
  void Query(MYSQL* conn, const std::string& sql, const std::string& ctx,
             const std::function<void(MYSQL_ROW)>& on_row) const;
  std::int64_t LastInsertId(MYSQL* conn) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetRetryListener(DbRetryListener listener);
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;
  std::string Quote(MYSQL* conn, const std::string& value) const;

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const { mysql_close(conn); }
  };
  using Connection = std::unique_ptr<MYSQL, ConnectionCloser>;

  Connection Connect() const;
  bool RunWithRetry(bool transactional, const std::function<bool(MYSQL*)>& work) const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  DbRetryListener retry_listener_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace warden
