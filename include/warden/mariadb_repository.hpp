/*
 * 설명: 계정/세션/역할/권한을 MariaDB에 저장하고 soft delete를 존중해 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <memory>

#include <mariadb/mysql.h>

#include "warden/db_client.hpp"
#include "warden/repository.hpp"

namespace warden {

class MariaDbRepository : public Repository {
 public:
  explicit MariaDbRepository(std::shared_ptr<MariaDbClient> db_client);

  std::optional<Account> FindAccountById(std::int64_t id) override;
  std::optional<Account> FindAccountByEmail(const std::string& email) override;
  std::optional<Account> FindAccountByUsername(const std::string& username) override;
  Account CreateAccount(const NewAccount& account) override;
  void SaveAccount(const Account& account) override;

  std::optional<SessionRecord> FindSession(const std::string& id) override;
  void CreateSession(const SessionRecord& session) override;
  void SaveSession(const SessionRecord& session) override;
  std::optional<SessionRecord> UpdateSession(const std::string& id,
                                             const std::function<void(SessionRecord&)>& mutate) override;
  std::vector<SessionRecord> ListAuthenticationSessions(std::int64_t account_id,
                                                        const std::optional<std::string>& ip) override;
  std::size_t InvalidateAuthenticationSessions(std::int64_t account_id) override;

  std::optional<Role> FindRoleByName(const std::string& name) override;
  Role CreateRole(const std::string& name, const std::string& description, const std::string& permissions) override;
  void AssignRole(std::int64_t account_id, std::int64_t role_id) override;
  std::vector<Role> ListRoles(std::int64_t account_id) override;
  Permission AssignPermission(std::int64_t account_id, const std::string& wildcard) override;
  std::vector<Permission> ListPermissions(std::int64_t account_id) override;

  void ClearAll() const;

 private:
  std::optional<Account> FindAccountWhere(const std::function<std::string(MYSQL*)>& where);
  Account BuildAccount(MYSQL_ROW row) const;
  SessionRecord BuildSession(MYSQL_ROW row) const;
  std::string SessionAssignments(MYSQL* conn, const SessionRecord& session) const;
  std::string ToTimestamp(const Clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace warden
