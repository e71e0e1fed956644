/*
 * 설명: 코드 풀에서 코드를 꺼내 정책에 맞는 세션 레코드를 만들고 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_factory_test.cpp
 */
#include "warden/session_factory.hpp"

#include <algorithm>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "warden/errors.hpp"

namespace warden {

SessionFactory::SessionFactory(std::shared_ptr<SessionEngine> engine, std::shared_ptr<CodePool> code_pool,
                               SessionPolicy policy)
    : engine_(std::move(engine)), code_pool_(std::move(code_pool)), policy_(policy) {}

IssuedSession SessionFactory::Issue(SessionKind kind, const RequestContext& ctx, const std::optional<Account>& account,
                                    const std::optional<std::string>& prior_token, bool two_factor) const {
  SessionRecord record;
  record.id = NextSessionId();
  record.kind = kind;
  record.date_created = Clock::now();
  record.ip = ctx.ip;

  switch (kind) {
    case SessionKind::kCaptcha: {
      std::string code = code_pool_->Pop();
      code.resize(std::min(code.size(), kCaptchaCodeLength));
      record.expiration_date = record.date_created + policy_.captcha_expiry;
      record.payload = ChallengeState{code};
      if (account) {
        record.account_id = account->id;
      }
      break;
    }
    case SessionKind::kVerification:
    case SessionKind::kTwoStep:
      record.account_id = RequireAccount(kind, account, prior_token);
      record.expiration_date = record.date_created + policy_.verification_expiry;
      record.payload = ChallengeState{code_pool_->Pop()};
      break;
    case SessionKind::kAuthentication:
      if (!account) {
        throw errors::AccountNotFound();
      }
      record.account_id = account->id;
      record.expiration_date = record.date_created + policy_.authentication_expiry;
      record.payload = AuthenticationState{two_factor, true};
      break;
  }

  engine_->repository()->CreateSession(record);
  return IssuedSession{record, engine_->Encode(record)};
}

std::int64_t SessionFactory::RequireAccount(SessionKind kind, const std::optional<Account>& account,
                                            const std::optional<std::string>& prior_token) const {
  if (account) {
    return account->id;
  }
  if (!prior_token || prior_token->empty()) {
    throw errors::AccountNotFound();
  }
  auto prior = engine_->Decode(kind, *prior_token);
  if (!prior.account_id) {
    throw errors::AccountNotFound();
  }
  return *prior.account_id;
}

std::string SessionFactory::NextSessionId() const {
  // random_generator는 스레드 안전하지 않으므로 스레드마다 하나씩 둔다.
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

}  // namespace warden
