/*
 * 설명: 단일 프로세스용 메모리 저장소로 계정/세션/역할을 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_repository_test.cpp
 */
#pragma once

#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>

#include "warden/repository.hpp"

namespace warden {

class InMemoryRepository : public Repository {
 public:
  InMemoryRepository() = default;

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

  // 테스트에서 soft delete를 재현하기 위해 사용한다.
  void MarkSessionDeleted(const std::string& id);
  void MarkAccountDeleted(std::int64_t id);
  std::size_t AccountCount() const;

 private:
  std::optional<Account> FindAccountIf(const std::function<bool(const Account&)>& pred) const;

  mutable std::mutex mutex_;
  std::int64_t next_account_id_{1};
  std::int64_t next_role_id_{1};
  std::int64_t next_permission_id_{1};
  std::map<std::int64_t, Account> accounts_;
  std::unordered_map<std::string, SessionRecord> sessions_;
  std::map<std::int64_t, Role> roles_;
  std::set<std::pair<std::int64_t, std::int64_t>> account_roles_;
  std::map<std::int64_t, Permission> permissions_;
};

}  // namespace warden
