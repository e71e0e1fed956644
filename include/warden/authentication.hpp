/*
 * 설명: 가입/로그인/로그아웃/갱신/2차 인증 해제와 요청 인증 가드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/authentication_flow_test.cpp, tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "warden/models.hpp"
#include "warden/observability.hpp"
#include "warden/password_hasher.hpp"
#include "warden/repository.hpp"
#include "warden/session_engine.hpp"
#include "warden/session_factory.hpp"

namespace warden {

constexpr const char* kHeadAdminName = "Head Admin";

struct RegistrationForm {
  std::string email;
  std::string username;
  std::string password;
  std::optional<std::string> phone;
};

struct AuthenticatedSession {
  SessionRecord session;
  Account account;
};

// 입력 형식 검사. 실패 시 errors::Credentials(400).
void ValidateRegistrationForm(const RegistrationForm& form);
void ValidatePassword(const std::string& password);

class AuthenticationService {
 public:
  AuthenticationService(std::shared_ptr<Repository> repository, std::shared_ptr<PasswordHasher> hasher,
                        std::shared_ptr<SessionEngine> engine, std::shared_ptr<SessionFactory> factory,
                        std::shared_ptr<Observability> observability, bool login_with_username);

  Account Register(const RegistrationForm& form, bool verified = false, bool disabled = false);
  IssuedSession Login(const RequestContext& ctx, const std::string& identifier, const std::string& password,
                      bool two_factor = false);
  // 위치 검사를 통과하고 2차 인증이 남지 않은 세션만 갱신한다.
  IssuedSession RefreshAuthentication(const RequestContext& ctx, const std::string& token);
  // two_step_session은 같은 계정에 발급되어 코드 확인까지 끝난 세션이어야 한다.
  SessionRecord OnSecondFactor(const SessionRecord& two_step_session, const std::string& token);
  SessionRecord Logout(const SessionRecord& session);
  AuthenticatedSession Authenticate(const RequestContext& ctx, const std::string& token);

  // 설정된 email/password로 Head Admin 계정과 역할을 보장한다.
  Account GenerateInitialAdmin(const std::string& email, const std::string& password);

 private:
  Account FindLoginAccount(const std::string& identifier) const;

  std::shared_ptr<Repository> repository_;
  std::shared_ptr<PasswordHasher> hasher_;
  std::shared_ptr<SessionEngine> engine_;
  std::shared_ptr<SessionFactory> factory_;
  std::shared_ptr<Observability> observability_;
  bool login_with_username_;
};

}  // namespace warden
