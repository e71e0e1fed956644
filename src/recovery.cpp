/*
 * 설명: 계정 복구 요청과 완료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/recovery_test.cpp
 */
#include "warden/recovery.hpp"

#include <algorithm>
#include <cctype>

#include "warden/authentication.hpp"

namespace warden {

RecoveryService::RecoveryService(std::shared_ptr<Repository> repository, std::shared_ptr<PasswordHasher> hasher,
                                 std::shared_ptr<SessionEngine> engine,
                                 std::shared_ptr<VerificationService> verification,
                                 std::shared_ptr<Observability> observability)
    : repository_(std::move(repository)),
      hasher_(std::move(hasher)),
      engine_(std::move(engine)),
      verification_(std::move(verification)),
      observability_(std::move(observability)) {}

IssuedSession RecoveryService::AttemptAccountRecovery(const RequestContext& ctx, const std::string& email) {
  std::string lowered = email;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  Account account = engine_->ValidateAccount(repository_->FindAccountByEmail(lowered));
  auto issued = verification_->RequestTwoStepVerification(ctx, account);
  observability_->Event(LogLevel::kInfo, "recovery.requested", {{"accountId", account.id}});
  return issued;
}

std::size_t RecoveryService::FulfillAccountRecoveryAttempt(const SessionRecord& two_step_session,
                                                           const std::string& new_password) {
  ValidatePassword(new_password);
  Account account = engine_->ResolveAccount(two_step_session);
  account.password_hash = hasher_->Hash(new_password);
  repository_->SaveAccount(account);
  auto revoked = engine_->RevokeAllAuthentication(account.id);
  observability_->Event(LogLevel::kInfo, "recovery.fulfilled",
                        {{"accountId", account.id}, {"revokedSessions", revoked}});
  return revoked;
}

}  // namespace warden
