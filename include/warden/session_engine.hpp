/*
 * 설명: 세션 상태 머신(코드 대조, 토큰 해석, 유효성 검사, 위치 확인, 폐기)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_engine_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "warden/models.hpp"
#include "warden/repository.hpp"
#include "warden/token_codec.hpp"

namespace warden {

class SessionEngine {
 public:
  SessionEngine(std::shared_ptr<Repository> repository, std::shared_ptr<TokenCodec> codec);

  // 시도 횟수 소진 검사가 코드 비교보다 먼저다. 6번째 시도는 올바른 코드여도 실패한다.
  // 잘못된 코드로 증가한 attempts는 예외가 나가도 저장된 상태로 남는다.
  SessionRecord Crosscheck(const SessionRecord& session, const std::string& presented_code) const;

  // 만료/유효성은 검사하지 않는다. 다른 종류의 세션을 가리키는 토큰은 NotFound.
  SessionRecord Decode(SessionKind kind, const std::string& token) const;

  // 존재 -> 삭제 -> 명시적 무효 -> 로그아웃 -> 만료 순서로 검사한다.
  void Validate(const std::optional<SessionRecord>& session, Clock::time_point now = Clock::now()) const;

  // 존재 -> 삭제 -> 비활성 -> 미인증 순서로 검사하고 계정을 돌려준다.
  Account ValidateAccount(const std::optional<Account>& account) const;
  Account ResolveAccount(const SessionRecord& session) const;

  void BindLocation(const SessionRecord& session, const std::string& request_ip) const;

  std::string Encode(const SessionRecord& session) const;
  void Revoke(SessionRecord& session) const;
  std::size_t RevokeAllAuthentication(std::int64_t account_id) const;

  const std::shared_ptr<Repository>& repository() const { return repository_; }

 private:
  std::shared_ptr<Repository> repository_;
  std::shared_ptr<TokenCodec> codec_;
};

}  // namespace warden
