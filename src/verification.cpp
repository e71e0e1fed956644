/*
 * 설명: 코드 기반 세션 발급/전달/대조 흐름을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/verification_test.cpp
 */
#include "warden/verification.hpp"

#include <functional>

#include "warden/captcha_renderer.hpp"
#include "warden/errors.hpp"

namespace warden {

VerificationService::VerificationService(std::shared_ptr<Repository> repository, std::shared_ptr<SessionEngine> engine,
                                         std::shared_ptr<SessionFactory> factory, std::shared_ptr<Delivery> delivery,
                                         std::shared_ptr<Observability> observability)
    : repository_(std::move(repository)),
      engine_(std::move(engine)),
      factory_(std::move(factory)),
      delivery_(std::move(delivery)),
      observability_(std::move(observability)) {}

IssuedSession VerificationService::RequestCaptcha(const RequestContext& ctx) {
  return factory_->Issue(SessionKind::kCaptcha, ctx);
}

SessionRecord VerificationService::RequiresCaptcha(const RequestContext& ctx, const std::string& token,
                                                   const std::string& code) {
  return DecodeAndCrosscheck(SessionKind::kCaptcha, ctx, token, code);
}

std::string VerificationService::CaptchaImage(const std::string& token) {
  auto session = engine_->Decode(SessionKind::kCaptcha, token);
  engine_->Validate(session);
  const auto* code = session.Code();
  auto seed = static_cast<std::uint32_t>(std::hash<std::string>{}(session.id));
  return RenderCaptchaSvg(code ? *code : std::string{}, seed);
}

IssuedSession VerificationService::RequestVerification(const RequestContext& ctx,
                                                       const std::optional<Account>& account,
                                                       const std::optional<std::string>& prior_token) {
  return IssueAndDeliver(SessionKind::kVerification, ctx, account, prior_token);
}

SessionRecord VerificationService::RequiresVerification(const RequestContext& ctx, const std::string& token,
                                                        const std::string& code) {
  return DecodeAndCrosscheck(SessionKind::kVerification, ctx, token, code);
}

Account VerificationService::VerifyAccount(const SessionRecord& verification_session) {
  Account account = engine_->ResolveAccount(verification_session);
  if (account.verified) {
    throw errors::AccountAlreadyVerified();
  }
  account.verified = true;
  repository_->SaveAccount(account);
  observability_->Event(LogLevel::kInfo, "verification.account_verified", {{"accountId", account.id}});
  return account;
}

IssuedSession VerificationService::RequestTwoStepVerification(const RequestContext& ctx,
                                                              const std::optional<Account>& account,
                                                              const std::optional<std::string>& prior_token) {
  return IssueAndDeliver(SessionKind::kTwoStep, ctx, account, prior_token);
}

SessionRecord VerificationService::RequiresTwoStepVerification(const RequestContext& ctx, const std::string& token,
                                                               const std::string& code) {
  return DecodeAndCrosscheck(SessionKind::kTwoStep, ctx, token, code);
}

IssuedSession VerificationService::IssueAndDeliver(SessionKind kind, const RequestContext& ctx,
                                                   const std::optional<Account>& account,
                                                   const std::optional<std::string>& prior_token) {
  auto issued = factory_->Issue(kind, ctx, account, prior_token);
  Account recipient = account ? *account : engine_->ResolveAccount(issued.session);
  const auto* code = issued.session.Code();
  std::string body = "인증 코드: " + (code ? *code : std::string{});
  delivery_->SendEmail(recipient.email, "계정 인증 코드", body);
  if (recipient.phone) {
    delivery_->SendSms(*recipient.phone, body);
  }
  observability_->Event(LogLevel::kInfo, "verification.requested",
                        {{"kind", std::string(SessionKindName(kind))},
                         {"accountId", recipient.id},
                         {"sessionId", issued.session.id}});
  return issued;
}

SessionRecord VerificationService::DecodeAndCrosscheck(SessionKind kind, const RequestContext& ctx,
                                                       const std::string& token, const std::string& code) {
  auto session = engine_->Decode(kind, token);
  engine_->Validate(session);
  try {
    return engine_->Crosscheck(session, code);
  } catch (const AuthError& ex) {
    observability_->Event(LogLevel::kWarn, "verification.crosscheck_failed",
                          {{"kind", std::string(SessionKindName(kind))},
                           {"sessionId", session.id},
                           {"ip", ctx.ip},
                           {"error", std::string(ErrorKindName(ex.kind))}});
    throw;
  }
}

}  // namespace warden
