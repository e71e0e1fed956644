/*
 * 설명: 인증된 세션의 계정에 대해 역할/와일드카드 권한을 검사한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/authorization_test.cpp
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "warden/authentication.hpp"
#include "warden/repository.hpp"

namespace warden {

// ':' 구간 단위로 비교한다. '*' 구간은 아무 구간과, 마지막 '*'는 남은 전부와 일치한다.
bool WildcardMatches(const std::string& granted, const std::string& required);

class AuthorizationService {
 public:
  AuthorizationService(std::shared_ptr<Repository> repository, std::shared_ptr<AuthenticationService> authentication);

  // 나열된 역할 중 하나라도 가지면 통과한다.
  void CheckRoles(const Account& account, const std::vector<std::string>& roles) const;
  void CheckPermissions(const Account& account, const std::vector<std::string>& required) const;

  // authenticate 가드를 먼저 실행한다.
  AuthenticatedSession RequireRoles(const RequestContext& ctx, const std::string& token,
                                    const std::vector<std::string>& roles) const;
  AuthenticatedSession RequirePermissions(const RequestContext& ctx, const std::string& token,
                                          const std::vector<std::string>& required) const;

  std::vector<std::string> GrantedPermissions(std::int64_t account_id) const;

 private:
  std::shared_ptr<Repository> repository_;
  std::shared_ptr<AuthenticationService> authentication_;
};

}  // namespace warden
