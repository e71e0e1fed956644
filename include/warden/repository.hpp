/*
 * 설명: 인증 엔진이 사용하는 계정/세션/역할 저장소 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_repository_test.cpp, tests/it/mariadb_repository_it_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "warden/models.hpp"

namespace warden {

// 고유 제약(email, phone, session id) 위반을 나타낸다.
class DuplicateEntryError : public std::runtime_error {
 public:
  explicit DuplicateEntryError(const std::string& message) : std::runtime_error(message) {}
};

// 모든 조회는 soft delete 된 행을 제외한다.
class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::optional<Account> FindAccountById(std::int64_t id) = 0;
  virtual std::optional<Account> FindAccountByEmail(const std::string& email) = 0;
  virtual std::optional<Account> FindAccountByUsername(const std::string& username) = 0;
  virtual Account CreateAccount(const NewAccount& account) = 0;
  virtual void SaveAccount(const Account& account) = 0;

  virtual std::optional<SessionRecord> FindSession(const std::string& id) = 0;
  virtual void CreateSession(const SessionRecord& session) = 0;
  virtual void SaveSession(const SessionRecord& session) = 0;
  // 같은 세션에 대한 동시 호출은 직렬화된다. 세션이 없으면 nullopt.
  virtual std::optional<SessionRecord> UpdateSession(const std::string& id,
                                                     const std::function<void(SessionRecord&)>& mutate) = 0;
  virtual std::vector<SessionRecord> ListAuthenticationSessions(std::int64_t account_id,
                                                                const std::optional<std::string>& ip) = 0;
  // 반환값은 무효화된 세션 수.
  virtual std::size_t InvalidateAuthenticationSessions(std::int64_t account_id) = 0;

  virtual std::optional<Role> FindRoleByName(const std::string& name) = 0;
  virtual Role CreateRole(const std::string& name, const std::string& description, const std::string& permissions) = 0;
  virtual void AssignRole(std::int64_t account_id, std::int64_t role_id) = 0;
  virtual std::vector<Role> ListRoles(std::int64_t account_id) = 0;
  virtual Permission AssignPermission(std::int64_t account_id, const std::string& wildcard) = 0;
  virtual std::vector<Permission> ListPermissions(std::int64_t account_id) = 0;
};

}  // namespace warden
