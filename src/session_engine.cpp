/*
 * 설명: 세션 상태 전이와 검사 순서를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_engine_test.cpp
 */
#include "warden/session_engine.hpp"

#include <openssl/crypto.h>

#include "warden/errors.hpp"

namespace warden {

namespace {
enum class CrosscheckOutcome { kMatched, kMismatch, kExhausted, kConsumed };

bool CodesEqual(const std::string* expected, const std::string& presented) {
  if (!expected || expected->empty() || expected->size() != presented.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected->data(), presented.data(), presented.size()) == 0;
}
}  // namespace

SessionEngine::SessionEngine(std::shared_ptr<Repository> repository, std::shared_ptr<TokenCodec> codec)
    : repository_(std::move(repository)), codec_(std::move(codec)) {}

SessionRecord SessionEngine::Crosscheck(const SessionRecord& session, const std::string& presented_code) const {
  CrosscheckOutcome outcome = CrosscheckOutcome::kMismatch;
  auto updated = repository_->UpdateSession(session.id, [&](SessionRecord& record) {
    if (record.attempts >= kMaxCrosscheckAttempts) {
      outcome = CrosscheckOutcome::kExhausted;
    } else if (!record.valid) {
      outcome = CrosscheckOutcome::kConsumed;
    } else if (!CodesEqual(record.Code(), presented_code)) {
      ++record.attempts;
      outcome = CrosscheckOutcome::kMismatch;
    } else {
      record.valid = false;
      outcome = CrosscheckOutcome::kMatched;
    }
  });
  if (!updated) {
    throw errors::SessionNotFound();
  }
  switch (outcome) {
    case CrosscheckOutcome::kExhausted:
      throw errors::MaximumAttempts();
    case CrosscheckOutcome::kConsumed:
      throw errors::Invalid();
    case CrosscheckOutcome::kMismatch:
      throw errors::Crosscheck();
    case CrosscheckOutcome::kMatched:
      break;
  }
  return *updated;
}

SessionRecord SessionEngine::Decode(SessionKind kind, const std::string& token) const {
  if (token.empty()) {
    throw errors::SessionNotFound();
  }
  auto claims = codec_->Decode(token);
  auto session = repository_->FindSession(claims.session_id);
  if (!session || session->kind != kind) {
    throw errors::SessionNotFound();
  }
  return *session;
}

void SessionEngine::Validate(const std::optional<SessionRecord>& session, Clock::time_point now) const {
  if (!session) {
    throw errors::SessionNotFound();
  }
  if (session->deleted) {
    throw errors::SessionDeleted();
  }
  if (!session->valid) {
    throw errors::Invalid();
  }
  if (const auto* state = session->Authentication(); state && !state->active) {
    throw errors::Deactivated();
  }
  if (session->IsExpired(now)) {
    throw errors::Expired();
  }
}

Account SessionEngine::ValidateAccount(const std::optional<Account>& account) const {
  if (!account) {
    throw errors::AccountNotFound();
  }
  if (account->deleted) {
    throw errors::AccountDeleted();
  }
  if (account->disabled) {
    throw errors::AccountDisabled();
  }
  if (!account->verified) {
    throw errors::AccountUnverified();
  }
  return *account;
}

Account SessionEngine::ResolveAccount(const SessionRecord& session) const {
  if (!session.account_id) {
    throw errors::AccountNotFound();
  }
  auto account = repository_->FindAccountById(*session.account_id);
  if (!account) {
    throw errors::AccountNotFound();
  }
  return *account;
}

void SessionEngine::BindLocation(const SessionRecord& session, const std::string& request_ip) const {
  if (session.kind != SessionKind::kAuthentication || !session.account_id) {
    throw errors::UnknownLocation();
  }
  auto known = repository_->ListAuthenticationSessions(*session.account_id, request_ip);
  if (known.empty()) {
    throw errors::UnknownLocation();
  }
}

std::string SessionEngine::Encode(const SessionRecord& session) const {
  TokenClaims claims;
  claims.issued_at = std::chrono::duration_cast<std::chrono::seconds>(session.date_created.time_since_epoch()).count();
  claims.session_id = session.id;
  claims.ip = session.ip;
  return codec_->Encode(claims);
}

void SessionEngine::Revoke(SessionRecord& session) const {
  auto updated = repository_->UpdateSession(session.id, [](SessionRecord& record) { record.valid = false; });
  if (!updated) {
    throw errors::SessionNotFound();
  }
  session = *updated;
}

std::size_t SessionEngine::RevokeAllAuthentication(std::int64_t account_id) const {
  return repository_->InvalidateAuthenticationSessions(account_id);
}

}  // namespace warden
