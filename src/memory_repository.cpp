/*
 * 설명: 뮤텍스로 보호되는 메모리 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/memory_repository_test.cpp
 */
#include "warden/memory_repository.hpp"

namespace warden {

std::optional<Account> InMemoryRepository::FindAccountIf(const std::function<bool(const Account&)>& pred) const {
  for (const auto& [id, account] : accounts_) {
    if (!account.deleted && pred(account)) {
      return account;
    }
  }
  return std::nullopt;
}

std::optional<Account> InMemoryRepository::FindAccountById(std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindAccountIf([id](const Account& a) { return a.id == id; });
}

std::optional<Account> InMemoryRepository::FindAccountByEmail(const std::string& email) {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindAccountIf([&email](const Account& a) { return a.email == email; });
}

std::optional<Account> InMemoryRepository::FindAccountByUsername(const std::string& username) {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindAccountIf([&username](const Account& a) { return a.username == username; });
}

Account InMemoryRepository::CreateAccount(const NewAccount& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  // 삭제된 계정도 고유 제약에 포함된다.
  for (const auto& [id, existing] : accounts_) {
    if (existing.email == account.email) {
      throw DuplicateEntryError("email 중복");
    }
    if (account.phone && existing.phone && *existing.phone == *account.phone) {
      throw DuplicateEntryError("phone 중복");
    }
  }
  Account record;
  record.id = next_account_id_++;
  record.username = account.username;
  record.email = account.email;
  record.phone = account.phone;
  record.password_hash = account.password_hash;
  record.verified = account.verified;
  record.disabled = account.disabled;
  record.date_created = Clock::now();
  record.date_updated = record.date_created;
  accounts_.emplace(record.id, record);
  return record;
}

void InMemoryRepository::SaveAccount(const Account& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(account.id);
  if (it == accounts_.end()) {
    return;
  }
  it->second = account;
  it->second.date_updated = Clock::now();
}

std::optional<SessionRecord> InMemoryRepository::FindSession(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end() || it->second.deleted) {
    return std::nullopt;
  }
  return it->second;
}

void InMemoryRepository::CreateSession(const SessionRecord& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!sessions_.emplace(session.id, session).second) {
    throw DuplicateEntryError("session id 중복");
  }
}

void InMemoryRepository::SaveSession(const SessionRecord& session) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session.id);
  if (it != sessions_.end()) {
    it->second = session;
  }
}

std::optional<SessionRecord> InMemoryRepository::UpdateSession(const std::string& id,
                                                               const std::function<void(SessionRecord&)>& mutate) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end() || it->second.deleted) {
    return std::nullopt;
  }
  mutate(it->second);
  return it->second;
}

std::vector<SessionRecord> InMemoryRepository::ListAuthenticationSessions(std::int64_t account_id,
                                                                          const std::optional<std::string>& ip) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SessionRecord> result;
  for (const auto& [id, session] : sessions_) {
    if (session.deleted || session.kind != SessionKind::kAuthentication || session.account_id != account_id) {
      continue;
    }
    if (ip && session.ip != *ip) {
      continue;
    }
    result.push_back(session);
  }
  return result;
}

std::size_t InMemoryRepository::InvalidateAuthenticationSessions(std::int64_t account_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (auto& [id, session] : sessions_) {
    if (!session.deleted && session.valid && session.kind == SessionKind::kAuthentication &&
        session.account_id == account_id) {
      session.valid = false;
      ++count;
    }
  }
  return count;
}

std::optional<Role> InMemoryRepository::FindRoleByName(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, role] : roles_) {
    if (role.name == name) {
      return role;
    }
  }
  return std::nullopt;
}

Role InMemoryRepository::CreateRole(const std::string& name, const std::string& description,
                                    const std::string& permissions) {
  std::lock_guard<std::mutex> lock(mutex_);
  Role role{next_role_id_++, name, description, permissions};
  roles_.emplace(role.id, role);
  return role;
}

void InMemoryRepository::AssignRole(std::int64_t account_id, std::int64_t role_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  account_roles_.emplace(account_id, role_id);
}

std::vector<Role> InMemoryRepository::ListRoles(std::int64_t account_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Role> result;
  for (const auto& [account, role_id] : account_roles_) {
    if (account != account_id) {
      continue;
    }
    auto it = roles_.find(role_id);
    if (it != roles_.end()) {
      result.push_back(it->second);
    }
  }
  return result;
}

Permission InMemoryRepository::AssignPermission(std::int64_t account_id, const std::string& wildcard) {
  std::lock_guard<std::mutex> lock(mutex_);
  Permission permission{next_permission_id_++, account_id, wildcard};
  permissions_.emplace(permission.id, permission);
  return permission;
}

std::vector<Permission> InMemoryRepository::ListPermissions(std::int64_t account_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Permission> result;
  for (const auto& [id, permission] : permissions_) {
    if (permission.account_id == account_id) {
      result.push_back(permission);
    }
  }
  return result;
}

void InMemoryRepository::MarkSessionDeleted(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(id);
  if (it != sessions_.end()) {
    it->second.deleted = true;
  }
}

void InMemoryRepository::MarkAccountDeleted(std::int64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(id);
  if (it != accounts_.end()) {
    it->second.deleted = true;
  }
}

std::size_t InMemoryRepository::AccountCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accounts_.size();
}

}  // namespace warden
