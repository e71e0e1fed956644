/*
 * 설명: 세션 종류별 만료/코드 길이 정책을 적용해 새 세션과 토큰을 발급한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_factory_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "warden/code_pool.hpp"
#include "warden/models.hpp"
#include "warden/session_engine.hpp"

namespace warden {

constexpr std::size_t kCaptchaCodeLength = 6;

struct SessionPolicy {
  std::chrono::hours authentication_expiry{24 * 30};
  std::chrono::minutes verification_expiry{1};
  std::chrono::minutes captcha_expiry{1};
};

struct IssuedSession {
  SessionRecord session;
  std::string token;
};

class SessionFactory {
 public:
  SessionFactory(std::shared_ptr<SessionEngine> engine, std::shared_ptr<CodePool> code_pool, SessionPolicy policy);

  // verification/two-step에서 account가 없으면 prior_token(같은 종류)이 가리키는 계정을 쓴다.
  IssuedSession Issue(SessionKind kind, const RequestContext& ctx, const std::optional<Account>& account = std::nullopt,
                      const std::optional<std::string>& prior_token = std::nullopt, bool two_factor = false) const;

  const SessionPolicy& policy() const { return policy_; }

 private:
  std::int64_t RequireAccount(SessionKind kind, const std::optional<Account>& account,
                              const std::optional<std::string>& prior_token) const;
  std::string NextSessionId() const;

  std::shared_ptr<SessionEngine> engine_;
  std::shared_ptr<CodePool> code_pool_;
  SessionPolicy policy_;
};

}  // namespace warden
