/*
 * 설명: captcha, 계정 인증, 2단계 인증 세션의 발급과 코드 확인 흐름을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/verification_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "warden/delivery.hpp"
#include "warden/models.hpp"
#include "warden/observability.hpp"
#include "warden/repository.hpp"
#include "warden/session_engine.hpp"
#include "warden/session_factory.hpp"

namespace warden {

class VerificationService {
 public:
  VerificationService(std::shared_ptr<Repository> repository, std::shared_ptr<SessionEngine> engine,
                      std::shared_ptr<SessionFactory> factory, std::shared_ptr<Delivery> delivery,
                      std::shared_ptr<Observability> observability);

  IssuedSession RequestCaptcha(const RequestContext& ctx);
  SessionRecord RequiresCaptcha(const RequestContext& ctx, const std::string& token, const std::string& code);
  std::string CaptchaImage(const std::string& token);

  IssuedSession RequestVerification(const RequestContext& ctx, const std::optional<Account>& account,
                                    const std::optional<std::string>& prior_token = std::nullopt);
  SessionRecord RequiresVerification(const RequestContext& ctx, const std::string& token, const std::string& code);
  // 이미 인증된 계정이면 errors::AccountAlreadyVerified().
  Account VerifyAccount(const SessionRecord& verification_session);

  IssuedSession RequestTwoStepVerification(const RequestContext& ctx, const std::optional<Account>& account,
                                           const std::optional<std::string>& prior_token = std::nullopt);
  SessionRecord RequiresTwoStepVerification(const RequestContext& ctx, const std::string& token,
                                            const std::string& code);

 private:
  IssuedSession IssueAndDeliver(SessionKind kind, const RequestContext& ctx, const std::optional<Account>& account,
                                const std::optional<std::string>& prior_token);
  SessionRecord DecodeAndCrosscheck(SessionKind kind, const RequestContext& ctx, const std::string& token,
                                    const std::string& code);

  std::shared_ptr<Repository> repository_;
  std::shared_ptr<SessionEngine> engine_;
  std::shared_ptr<SessionFactory> factory_;
  std::shared_ptr<Delivery> delivery_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace warden
