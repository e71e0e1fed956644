/*
 * 설명: 오류 종류별 상태 코드와 메시지를 고정해 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_engine_test.cpp, tests/unit/authentication_flow_test.cpp
 */
#include "warden/errors.hpp"

namespace warden {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kCredentials:
      return "CredentialsError";
    case ErrorKind::kAccount:
      return "AccountError";
    case ErrorKind::kNotFound:
      return "NotFoundError";
    case ErrorKind::kDecode:
      return "DecodeError";
    case ErrorKind::kInvalid:
      return "InvalidError";
    case ErrorKind::kExpired:
      return "ExpiredError";
    case ErrorKind::kDeactivated:
      return "DeactivatedError";
    case ErrorKind::kMaximumAttempts:
      return "MaximumAttemptsError";
    case ErrorKind::kCrosscheck:
      return "CrosscheckError";
    case ErrorKind::kUnknownLocation:
      return "UnknownLocationError";
    case ErrorKind::kSecondFactor:
      return "SecondFactorError";
    case ErrorKind::kInsufficientRole:
      return "InsufficientRoleError";
    case ErrorKind::kInsufficientPermission:
      return "InsufficientPermissionError";
    case ErrorKind::kProhibitedProxy:
      return "ProhibitedProxyError";
  }
  return "UnknownError";
}

namespace errors {

AuthError Credentials(const std::string& message, int status) {
  return AuthError(ErrorKind::kCredentials, status, "invalid_credentials", message);
}

// 어떤 필드가 충돌했는지 드러내지 않는다.
AuthError DuplicateCredentials() {
  return AuthError(ErrorKind::kCredentials, 409, "credentials_exist", "해당 자격 증명을 가진 계정이 이미 존재할 수 있습니다");
}

AuthError IncorrectPassword() {
  return AuthError(ErrorKind::kCredentials, 401, "incorrect_password", "비밀번호가 올바르지 않습니다");
}

AuthError AccountDisabled() {
  return AuthError(ErrorKind::kAccount, 401, "account_disabled", "비활성화된 계정입니다");
}

AuthError AccountUnverified() {
  return AuthError(ErrorKind::kAccount, 401, "account_unverified", "계정 인증이 필요합니다");
}

AuthError AccountAlreadyVerified() {
  return AuthError(ErrorKind::kAccount, 409, "account_verified", "이미 인증된 계정입니다");
}

AuthError AccountNotFound() {
  return AuthError(ErrorKind::kNotFound, 404, "account_not_found", "계정을 찾을 수 없습니다");
}

AuthError AccountDeleted() {
  return AuthError(ErrorKind::kAccount, 404, "account_deleted", "영구 삭제된 계정입니다");
}

AuthError SessionNotFound() {
  return AuthError(ErrorKind::kNotFound, 404, "session_not_found", "세션을 찾을 수 없습니다");
}

AuthError SessionDeleted() {
  return AuthError(ErrorKind::kNotFound, 404, "session_deleted", "삭제된 세션입니다");
}

// 존재하지 않는 세션과 구분되지 않도록 같은 상태 코드를 쓴다.
AuthError Decode() {
  return AuthError(ErrorKind::kDecode, 404, "session_unavailable", "세션을 사용할 수 없습니다");
}

AuthError Invalid() {
  return AuthError(ErrorKind::kInvalid, 401, "session_invalid", "유효하지 않은 세션입니다");
}

AuthError Expired() {
  return AuthError(ErrorKind::kExpired, 401, "session_expired", "만료된 세션입니다");
}

AuthError Deactivated() {
  return AuthError(ErrorKind::kDeactivated, 401, "session_deactivated", "로그아웃된 세션입니다");
}

AuthError MaximumAttempts() {
  return AuthError(ErrorKind::kMaximumAttempts, 401, "maximum_attempts", "최대 시도 횟수를 초과했습니다");
}

AuthError Crosscheck() {
  return AuthError(ErrorKind::kCrosscheck, 401, "crosscheck_failed", "코드가 일치하지 않습니다");
}

AuthError UnknownLocation() {
  return AuthError(ErrorKind::kUnknownLocation, 401, "unknown_location", "알 수 없는 위치에서 사용된 세션입니다");
}

AuthError SecondFactorRequired() {
  return AuthError(ErrorKind::kSecondFactor, 401, "second_factor_required", "2차 인증이 필요합니다");
}

AuthError SecondFactorFulfilled() {
  return AuthError(ErrorKind::kSecondFactor, 403, "second_factor_fulfilled", "2차 인증 요구가 이미 충족되었습니다");
}

AuthError SecondFactorMismatch() {
  return AuthError(ErrorKind::kSecondFactor, 403, "second_factor_mismatch", "다른 계정의 2단계 인증 세션입니다");
}

AuthError InsufficientRole() {
  return AuthError(ErrorKind::kInsufficientRole, 403, "insufficient_role", "이 작업에 필요한 역할이 없습니다");
}

AuthError InsufficientPermission() {
  return AuthError(ErrorKind::kInsufficientPermission, 403, "insufficient_permission",
                   "이 작업에 필요한 권한이 없습니다");
}

AuthError ProhibitedProxy() {
  return AuthError(ErrorKind::kProhibitedProxy, 403, "prohibited_proxy", "금지된 프록시에서의 접근입니다");
}

}  // namespace errors

}  // namespace warden
