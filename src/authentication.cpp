/*
 * 설명: 해시/세션 엔진/팩토리를 조합해 인증 흐름을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/authentication_flow_test.cpp, tests/e2e/auth_flow_test.cpp
 */
#include "warden/authentication.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "warden/errors.hpp"

namespace warden {

namespace {
const std::regex& EmailPattern() {
  static const std::regex pattern(R"(^[a-zA-Z0-9_.+-]+@[a-zA-Z0-9-]+\.[a-zA-Z0-9-.]+$)");
  return pattern;
}

const std::regex& UsernamePattern() {
  static const std::regex pattern(R"(^[A-Za-z0-9_-]{3,32}$)");
  return pattern;
}

const std::regex& PhonePattern() {
  static const std::regex pattern(R"(^[0-9]{11,14}$)");
  return pattern;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

void ValidatePassword(const std::string& password) {
  if (password.size() <= 8 || password.size() >= 100) {
    throw errors::Credentials("비밀번호는 8자보다 길고 100자보다 짧아야 합니다");
  }
}

void ValidateRegistrationForm(const RegistrationForm& form) {
  if (!std::regex_match(form.email, EmailPattern())) {
    throw errors::Credentials("you@mail.com 같은 올바른 email 형식을 사용하세요");
  }
  if (!std::regex_match(form.username, UsernamePattern())) {
    throw errors::Credentials("username은 3-32자이며 _ 와 - 외의 특수문자를 쓸 수 없습니다");
  }
  if (form.phone && !std::regex_match(*form.phone, PhonePattern())) {
    throw errors::Credentials("전화번호는 국가 코드를 포함한 11-14자리 숫자여야 합니다");
  }
  ValidatePassword(form.password);
}

AuthenticationService::AuthenticationService(std::shared_ptr<Repository> repository,
                                             std::shared_ptr<PasswordHasher> hasher,
                                             std::shared_ptr<SessionEngine> engine,
                                             std::shared_ptr<SessionFactory> factory,
                                             std::shared_ptr<Observability> observability, bool login_with_username)
    : repository_(std::move(repository)),
      hasher_(std::move(hasher)),
      engine_(std::move(engine)),
      factory_(std::move(factory)),
      observability_(std::move(observability)),
      login_with_username_(login_with_username) {}

Account AuthenticationService::Register(const RegistrationForm& form, bool verified, bool disabled) {
  ValidateRegistrationForm(form);
  NewAccount record;
  record.email = ToLower(form.email);
  record.username = form.username;
  record.phone = form.phone;
  record.password_hash = hasher_->Hash(form.password);
  record.verified = verified;
  record.disabled = disabled;
  try {
    auto account = repository_->CreateAccount(record);
    observability_->Event(LogLevel::kInfo, "auth.register", {{"accountId", account.id}});
    return account;
  } catch (const DuplicateEntryError&) {
    throw errors::DuplicateCredentials();
  }
}

Account AuthenticationService::FindLoginAccount(const std::string& identifier) const {
  auto account = repository_->FindAccountByEmail(ToLower(identifier));
  if (!account && login_with_username_) {
    account = repository_->FindAccountByUsername(identifier);
  }
  if (!account) {
    throw errors::AccountNotFound();
  }
  return *account;
}

IssuedSession AuthenticationService::Login(const RequestContext& ctx, const std::string& identifier,
                                           const std::string& password, bool two_factor) {
  Account account = FindLoginAccount(identifier);
  if (!hasher_->Verify(account.password_hash, password)) {
    observability_->IncrementRejectedAuthentication();
    observability_->Event(LogLevel::kWarn, "auth.login.incorrect_password",
                          {{"email", account.email}, {"ip", ctx.ip}, {"traceId", ctx.trace_id}});
    throw errors::IncorrectPassword();
  }
  engine_->ValidateAccount(account);
  if (hasher_->NeedsRehash(account.password_hash)) {
    account.password_hash = hasher_->Hash(password);
    repository_->SaveAccount(account);
  }
  auto issued = factory_->Issue(SessionKind::kAuthentication, ctx, account, std::nullopt, two_factor);
  observability_->IncrementLogin();
  observability_->Event(LogLevel::kInfo, "auth.login",
                        {{"accountId", account.id}, {"sessionId", issued.session.id}, {"twoFactor", two_factor}});
  return issued;
}

IssuedSession AuthenticationService::RefreshAuthentication(const RequestContext& ctx, const std::string& token) {
  auto session = engine_->Decode(SessionKind::kAuthentication, token);
  engine_->Validate(session);
  Account account = engine_->ValidateAccount(repository_->FindAccountById(session.account_id.value_or(0)));
  // 2차 인증이 남은 세션은 갱신으로 그 요구를 지울 수 없다.
  const auto* state = session.Authentication();
  if (state && state->two_factor) {
    throw errors::SecondFactorRequired();
  }
  engine_->BindLocation(session, ctx.ip);
  auto issued = factory_->Issue(SessionKind::kAuthentication, ctx, account);
  observability_->Event(LogLevel::kInfo, "auth.refresh",
                        {{"accountId", account.id},
                         {"previousSessionId", session.id},
                         {"sessionId", issued.session.id}});
  return issued;
}

SessionRecord AuthenticationService::OnSecondFactor(const SessionRecord& two_step_session, const std::string& token) {
  auto session = engine_->Decode(SessionKind::kAuthentication, token);
  engine_->Validate(session);
  // 코드가 확인되어 소모된 2단계 세션만 받는다.
  if (two_step_session.kind != SessionKind::kTwoStep || two_step_session.valid) {
    throw errors::Invalid();
  }
  if (!two_step_session.account_id || two_step_session.account_id != session.account_id) {
    observability_->Event(LogLevel::kWarn, "auth.second_factor.account_mismatch",
                          {{"sessionId", session.id}, {"twoStepSessionId", two_step_session.id}});
    throw errors::SecondFactorMismatch();
  }
  bool was_pending = false;
  auto updated = repository_->UpdateSession(session.id, [&](SessionRecord& record) {
    auto* state = record.Authentication();
    was_pending = state && state->two_factor;
    if (was_pending) {
      state->two_factor = false;
    }
  });
  if (!updated) {
    throw errors::SessionNotFound();
  }
  if (!was_pending) {
    throw errors::SecondFactorFulfilled();
  }
  return *updated;
}

SessionRecord AuthenticationService::Logout(const SessionRecord& session) {
  auto updated = repository_->UpdateSession(session.id, [](SessionRecord& record) {
    if (auto* state = record.Authentication()) {
      state->active = false;
    }
  });
  if (!updated) {
    throw errors::SessionNotFound();
  }
  observability_->Event(LogLevel::kInfo, "auth.logout",
                        {{"sessionId", session.id}, {"accountId", session.account_id.value_or(0)}});
  return *updated;
}

AuthenticatedSession AuthenticationService::Authenticate(const RequestContext& ctx, const std::string& token) {
  try {
    auto session = engine_->Decode(SessionKind::kAuthentication, token);
    engine_->Validate(session);
    Account account = engine_->ValidateAccount(repository_->FindAccountById(session.account_id.value_or(0)));
    const auto* state = session.Authentication();
    if (state && state->two_factor) {
      throw errors::SecondFactorRequired();
    }
    engine_->BindLocation(session, ctx.ip);
    return AuthenticatedSession{session, account};
  } catch (const AuthError& ex) {
    observability_->IncrementRejectedAuthentication();
    if (ex.kind == ErrorKind::kUnknownLocation) {
      observability_->Event(LogLevel::kWarn, "auth.unknown_location", {{"ip", ctx.ip}, {"traceId", ctx.trace_id}});
    }
    throw;
  }
}

Account AuthenticationService::GenerateInitialAdmin(const std::string& email, const std::string& password) {
  auto role = repository_->FindRoleByName(kHeadAdminName);
  if (!role) {
    role = repository_->CreateRole(kHeadAdminName, "API의 모든 영역을 제어할 수 있습니다. 신중하게 부여하세요.", "*:*");
  }
  auto existing = repository_->FindAccountByUsername(kHeadAdminName);
  if (existing) {
    auto roles = repository_->ListRoles(existing->id);
    bool has_role = std::any_of(roles.begin(), roles.end(), [&](const Role& r) { return r.id == role->id; });
    if (!has_role) {
      repository_->AssignRole(existing->id, role->id);
      observability_->Event(LogLevel::kWarn, "auth.initial_admin.role_reinstated", {{"accountId", existing->id}});
    }
    return *existing;
  }

  NewAccount record;
  record.username = kHeadAdminName;
  record.email = ToLower(email);
  record.password_hash = hasher_->Hash(password);
  record.verified = true;
  Account account;
  try {
    account = repository_->CreateAccount(record);
  } catch (const DuplicateEntryError&) {
    throw errors::DuplicateCredentials();
  }
  repository_->AssignRole(account.id, role->id);
  observability_->Event(LogLevel::kInfo, "auth.initial_admin.generated", {{"accountId", account.id}});
  return account;
}

}  // namespace warden
