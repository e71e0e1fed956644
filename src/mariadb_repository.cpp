/*
 * 설명: 인증 저장소 인터페이스를 MariaDB 쿼리로 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md, db/schema.sql
 * 테스트: tests/it/mariadb_repository_it_test.cpp
 */
#include "warden/mariadb_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace warden {
namespace {
constexpr const char* kAccountColumns =
    "id, username, email, phone, password, disabled, verified, deleted, date_created, date_updated";
constexpr const char* kSessionColumns =
    "id, kind, account_id, date_created, expiration_date, valid, ip, attempts, code, two_factor, active, deleted";

std::int64_t ToInt64(const char* value) { return value ? std::stoll(value) : 0; }
bool ToBool(const char* value) { return value && std::string(value) != "0"; }
std::string ToString(const char* value) { return value ? value : ""; }

Clock::time_point ParseTimestamp(const char* text) {
  if (!text) {
    return Clock::time_point{};
  }
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return Clock::from_time_t(timegm(&tm));
}
}  // namespace

MariaDbRepository::MariaDbRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

std::optional<Account> MariaDbRepository::FindAccountWhere(const std::function<std::string(MYSQL*)>& where) {
  std::optional<Account> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kAccountColumns << " FROM accounts WHERE deleted=0 AND " << where(conn)
        << " ORDER BY id LIMIT 1;";
    db_client_->Query(conn, oss.str(), "계정 조회 실패", [&](MYSQL_ROW row) { result = BuildAccount(row); });
  });
  return result;
}

std::optional<Account> MariaDbRepository::FindAccountById(std::int64_t id) {
  return FindAccountWhere([id](MYSQL*) { return "id=" + std::to_string(id); });
}

std::optional<Account> MariaDbRepository::FindAccountByEmail(const std::string& email) {
  return FindAccountWhere([&](MYSQL* conn) { return "email=" + db_client_->Quote(conn, email); });
}

std::optional<Account> MariaDbRepository::FindAccountByUsername(const std::string& username) {
  return FindAccountWhere([&](MYSQL* conn) { return "username=" + db_client_->Quote(conn, username); });
}

Account MariaDbRepository::CreateAccount(const NewAccount& account) {
  std::int64_t id = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO accounts(username, email, phone, password, disabled, verified) VALUES("
        << db_client_->Quote(conn, account.username) << ", " << db_client_->Quote(conn, account.email) << ", "
        << (account.phone ? db_client_->Quote(conn, *account.phone) : std::string("NULL")) << ", "
        << db_client_->Quote(conn, account.password_hash) << ", " << (account.disabled ? 1 : 0) << ", "
        << (account.verified ? 1 : 0) << ");";
    if (!db_client_->Execute(conn, oss.str(), "계정 생성 실패")) {
      throw DuplicateEntryError("계정 고유 제약 위반");
    }
    id = db_client_->LastInsertId(conn);
  });
  auto created = FindAccountById(id);
  if (!created) {
    throw DbException("생성한 계정을 다시 읽지 못했습니다", 0, false);
  }
  return *created;
}

void MariaDbRepository::SaveAccount(const Account& account) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE accounts SET username=" << db_client_->Quote(conn, account.username)
        << ", email=" << db_client_->Quote(conn, account.email)
        << ", phone=" << (account.phone ? db_client_->Quote(conn, *account.phone) : std::string("NULL"))
        << ", password=" << db_client_->Quote(conn, account.password_hash)
        << ", disabled=" << (account.disabled ? 1 : 0) << ", verified=" << (account.verified ? 1 : 0)
        << ", deleted=" << (account.deleted ? 1 : 0) << " WHERE id=" << account.id << ";";
    if (!db_client_->Execute(conn, oss.str(), "계정 저장 실패")) {
      throw DuplicateEntryError("계정 고유 제약 위반");
    }
  });
}

std::optional<SessionRecord> MariaDbRepository::FindSession(const std::string& id) {
  std::optional<SessionRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kSessionColumns << " FROM sessions WHERE deleted=0 AND id=" << db_client_->Quote(conn, id)
        << ";";
    db_client_->Query(conn, oss.str(), "세션 조회 실패", [&](MYSQL_ROW row) { result = BuildSession(row); });
  });
  return result;
}

void MariaDbRepository::CreateSession(const SessionRecord& session) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO sessions SET id=" << db_client_->Quote(conn, session.id)
        << ", kind=" << db_client_->Quote(conn, std::string(SessionKindName(session.kind)))
        << ", date_created=" << db_client_->Quote(conn, ToTimestamp(session.date_created)) << ", "
        << SessionAssignments(conn, session) << ";";
    if (!db_client_->Execute(conn, oss.str(), "세션 생성 실패")) {
      throw DuplicateEntryError("session id 중복");
    }
  });
}

void MariaDbRepository::SaveSession(const SessionRecord& session) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE sessions SET " << SessionAssignments(conn, session)
        << " WHERE id=" << db_client_->Quote(conn, session.id) << ";";
    db_client_->Execute(conn, oss.str(), "세션 저장 실패");
  });
}

std::optional<SessionRecord> MariaDbRepository::UpdateSession(const std::string& id,
                                                              const std::function<void(SessionRecord&)>& mutate) {
  std::optional<SessionRecord> result;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    result.reset();
    std::ostringstream select;
    select << "SELECT " << kSessionColumns << " FROM sessions WHERE deleted=0 AND id=" << db_client_->Quote(conn, id)
           << " FOR UPDATE;";
    db_client_->Query(conn, select.str(), "세션 잠금 조회 실패", [&](MYSQL_ROW row) { result = BuildSession(row); });
    if (!result) {
      return false;
    }
    mutate(*result);
    std::ostringstream update;
    update << "UPDATE sessions SET " << SessionAssignments(conn, *result)
           << " WHERE id=" << db_client_->Quote(conn, id) << ";";
    db_client_->Execute(conn, update.str(), "세션 갱신 실패");
    return true;
  });
  return result;
}

std::vector<SessionRecord> MariaDbRepository::ListAuthenticationSessions(std::int64_t account_id,
                                                                         const std::optional<std::string>& ip) {
  std::vector<SessionRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT " << kSessionColumns << " FROM sessions WHERE deleted=0 AND kind='authentication' AND account_id="
        << account_id;
    if (ip) {
      oss << " AND ip=" << db_client_->Quote(conn, *ip);
    }
    oss << ";";
    db_client_->Query(conn, oss.str(), "인증 세션 목록 조회 실패",
                      [&](MYSQL_ROW row) { result.push_back(BuildSession(row)); });
  });
  return result;
}

std::size_t MariaDbRepository::InvalidateAuthenticationSessions(std::int64_t account_id) {
  std::size_t affected = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE sessions SET valid=0 WHERE deleted=0 AND valid=1 AND kind='authentication' AND account_id="
        << account_id << ";";
    db_client_->Execute(conn, oss.str(), "인증 세션 일괄 무효화 실패");
    affected = static_cast<std::size_t>(mysql_affected_rows(conn));
  });
  return affected;
}

std::optional<Role> MariaDbRepository::FindRoleByName(const std::string& name) {
  std::optional<Role> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::string sql = "SELECT id, name, description, permissions FROM roles WHERE name=" +
                      db_client_->Quote(conn, name) + ";";
    db_client_->Query(conn, sql, "역할 조회 실패", [&](MYSQL_ROW row) {
      result = Role{ToInt64(row[0]), ToString(row[1]), ToString(row[2]), ToString(row[3])};
    });
  });
  return result;
}

Role MariaDbRepository::CreateRole(const std::string& name, const std::string& description,
                                   const std::string& permissions) {
  Role role{0, name, description, permissions};
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO roles(name, description, permissions) VALUES(" << db_client_->Quote(conn, name) << ", "
        << db_client_->Quote(conn, description) << ", " << db_client_->Quote(conn, permissions) << ");";
    if (!db_client_->Execute(conn, oss.str(), "역할 생성 실패")) {
      throw DuplicateEntryError("역할 이름 중복");
    }
    role.id = db_client_->LastInsertId(conn);
  });
  return role;
}

void MariaDbRepository::AssignRole(std::int64_t account_id, std::int64_t role_id) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT IGNORE INTO account_roles(account_id, role_id) VALUES(" << account_id << ", " << role_id << ");";
    db_client_->Execute(conn, oss.str(), "역할 부여 실패");
  });
}

std::vector<Role> MariaDbRepository::ListRoles(std::int64_t account_id) {
  std::vector<Role> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT r.id, r.name, r.description, r.permissions FROM roles r JOIN account_roles ar ON ar.role_id=r.id "
           "WHERE ar.account_id="
        << account_id << ";";
    db_client_->Query(conn, oss.str(), "역할 목록 조회 실패", [&](MYSQL_ROW row) {
      result.push_back(Role{ToInt64(row[0]), ToString(row[1]), ToString(row[2]), ToString(row[3])});
    });
  });
  return result;
}

Permission MariaDbRepository::AssignPermission(std::int64_t account_id, const std::string& wildcard) {
  Permission permission{0, account_id, wildcard};
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO permissions(account_id, wildcard) VALUES(" << account_id << ", "
        << db_client_->Quote(conn, wildcard) << ");";
    db_client_->Execute(conn, oss.str(), "권한 부여 실패");
    permission.id = db_client_->LastInsertId(conn);
  });
  return permission;
}

std::vector<Permission> MariaDbRepository::ListPermissions(std::int64_t account_id) {
  std::vector<Permission> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT id, account_id, wildcard FROM permissions WHERE account_id=" << account_id << ";";
    db_client_->Query(conn, oss.str(), "권한 목록 조회 실패", [&](MYSQL_ROW row) {
      result.push_back(Permission{ToInt64(row[0]), ToInt64(row[1]), ToString(row[2])});
    });
  });
  return result;
}

void MariaDbRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM permissions;", "권한 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM account_roles;", "역할 연결 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM roles;", "역할 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM sessions;", "세션 초기화 실패");
    db_client_->Execute(conn, "DELETE FROM accounts;", "계정 초기화 실패");
  });
}

Account MariaDbRepository::BuildAccount(MYSQL_ROW row) const {
  Account account;
  account.id = ToInt64(row[0]);
  account.username = ToString(row[1]);
  account.email = ToString(row[2]);
  if (row[3]) {
    account.phone = std::string(row[3]);
  }
  account.password_hash = ToString(row[4]);
  account.disabled = ToBool(row[5]);
  account.verified = ToBool(row[6]);
  account.deleted = ToBool(row[7]);
  account.date_created = ParseTimestamp(row[8]);
  account.date_updated = ParseTimestamp(row[9]);
  return account;
}

SessionRecord MariaDbRepository::BuildSession(MYSQL_ROW row) const {
  SessionRecord session;
  session.id = ToString(row[0]);
  session.kind = ParseSessionKind(ToString(row[1])).value_or(SessionKind::kAuthentication);
  if (row[2]) {
    session.account_id = ToInt64(row[2]);
  }
  session.date_created = ParseTimestamp(row[3]);
  session.expiration_date = ParseTimestamp(row[4]);
  session.valid = ToBool(row[5]);
  session.ip = ToString(row[6]);
  session.attempts = static_cast<int>(ToInt64(row[7]));
  if (session.kind == SessionKind::kAuthentication) {
    session.payload = AuthenticationState{ToBool(row[9]), ToBool(row[10])};
  } else {
    session.payload = ChallengeState{ToString(row[8])};
  }
  session.deleted = ToBool(row[11]);
  return session;
}

std::string MariaDbRepository::SessionAssignments(MYSQL* conn, const SessionRecord& session) const {
  std::ostringstream oss;
  oss << "account_id=" << (session.account_id ? std::to_string(*session.account_id) : std::string("NULL"))
      << ", expiration_date=" << db_client_->Quote(conn, ToTimestamp(session.expiration_date))
      << ", valid=" << (session.valid ? 1 : 0) << ", ip=" << db_client_->Quote(conn, session.ip)
      << ", attempts=" << session.attempts << ", deleted=" << (session.deleted ? 1 : 0);
  if (const auto* code = session.Code()) {
    oss << ", code=" << db_client_->Quote(conn, *code);
  }
  if (const auto* state = session.Authentication()) {
    oss << ", two_factor=" << (state->two_factor ? 1 : 0) << ", active=" << (state->active ? 1 : 0);
  }
  return oss.str();
}

std::string MariaDbRepository::ToTimestamp(const Clock::time_point& tp) const {
  auto tt = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace warden
