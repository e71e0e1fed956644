/*
 * 설명: 인증/세션/인가 오류 종류와 예외 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_engine_test.cpp, tests/unit/authentication_flow_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace warden {

enum class ErrorKind {
  kCredentials,
  kAccount,
  kNotFound,
  kDecode,
  kInvalid,
  kExpired,
  kDeactivated,
  kMaximumAttempts,
  kCrosscheck,
  kUnknownLocation,
  kSecondFactor,
  kInsufficientRole,
  kInsufficientPermission,
  kProhibitedProxy,
};

std::string_view ErrorKindName(ErrorKind kind);

class AuthError : public std::runtime_error {
 public:
  AuthError(ErrorKind kind, int status, std::string code, const std::string& message)
      : std::runtime_error(message), kind(kind), status(status), code(std::move(code)) {}
  ErrorKind kind;
  int status;
  std::string code;
};

namespace errors {

AuthError Credentials(const std::string& message, int status = 400);
AuthError DuplicateCredentials();
AuthError IncorrectPassword();
AuthError AccountDisabled();
AuthError AccountUnverified();
AuthError AccountAlreadyVerified();
AuthError AccountNotFound();
AuthError AccountDeleted();
AuthError SessionNotFound();
AuthError SessionDeleted();
AuthError Decode();
AuthError Invalid();
AuthError Expired();
AuthError Deactivated();
AuthError MaximumAttempts();
AuthError Crosscheck();
AuthError UnknownLocation();
AuthError SecondFactorRequired();
AuthError SecondFactorFulfilled();
AuthError SecondFactorMismatch();
AuthError InsufficientRole();
AuthError InsufficientPermission();
AuthError ProhibitedProxy();

}  // namespace errors

}  // namespace warden
