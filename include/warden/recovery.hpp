/*
 * 설명: 2단계 인증을 거친 계정 복구(비밀번호 재설정)를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/recovery_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "warden/observability.hpp"
#include "warden/password_hasher.hpp"
#include "warden/repository.hpp"
#include "warden/session_engine.hpp"
#include "warden/verification.hpp"

namespace warden {

class RecoveryService {
 public:
  RecoveryService(std::shared_ptr<Repository> repository, std::shared_ptr<PasswordHasher> hasher,
                  std::shared_ptr<SessionEngine> engine, std::shared_ptr<VerificationService> verification,
                  std::shared_ptr<Observability> observability);

  IssuedSession AttemptAccountRecovery(const RequestContext& ctx, const std::string& email);
  // 비밀번호를 바꾸고 계정의 유효한 인증 세션을 모두 폐기한다. 반환값은 폐기된 세션 수.
  std::size_t FulfillAccountRecoveryAttempt(const SessionRecord& two_step_session, const std::string& new_password);

 private:
  std::shared_ptr<Repository> repository_;
  std::shared_ptr<PasswordHasher> hasher_;
  std::shared_ptr<SessionEngine> engine_;
  std::shared_ptr<VerificationService> verification_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace warden
