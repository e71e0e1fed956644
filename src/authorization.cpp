/*
 * 설명: 역할 이름 비교와 와일드카드 권한 매칭을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/authorization_test.cpp
 */
#include "warden/authorization.hpp"

#include <algorithm>

#include "warden/config.hpp"
#include "warden/errors.hpp"

namespace warden {

namespace {
std::vector<std::string> Segments(const std::string& value) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (true) {
    auto pos = value.find(':', start);
    if (pos == std::string::npos) {
      segments.push_back(value.substr(start));
      break;
    }
    segments.push_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return segments;
}
}  // namespace

bool WildcardMatches(const std::string& granted, const std::string& required) {
  if (granted.empty() || required.empty()) {
    return false;
  }
  auto g = Segments(granted);
  auto r = Segments(required);
  // "*", "*:*" 처럼 별표로만 된 권한은 세그먼트 수와 무관하게 모두 허용한다.
  if (std::all_of(g.begin(), g.end(), [](const std::string& segment) { return segment == "*"; })) {
    return true;
  }
  for (std::size_t i = 0; i < g.size(); ++i) {
    if (g[i] == "*" && i + 1 == g.size()) {
      return r.size() >= g.size();
    }
    if (i >= r.size()) {
      return false;
    }
    if (g[i] != "*" && g[i] != r[i]) {
      return false;
    }
  }
  return g.size() == r.size();
}

AuthorizationService::AuthorizationService(std::shared_ptr<Repository> repository,
                                           std::shared_ptr<AuthenticationService> authentication)
    : repository_(std::move(repository)), authentication_(std::move(authentication)) {}

void AuthorizationService::CheckRoles(const Account& account, const std::vector<std::string>& roles) const {
  auto held = repository_->ListRoles(account.id);
  for (const auto& role : held) {
    if (std::find(roles.begin(), roles.end(), role.name) != roles.end()) {
      return;
    }
  }
  throw errors::InsufficientRole();
}

std::vector<std::string> AuthorizationService::GrantedPermissions(std::int64_t account_id) const {
  std::vector<std::string> granted;
  for (const auto& permission : repository_->ListPermissions(account_id)) {
    granted.push_back(permission.wildcard);
  }
  for (const auto& role : repository_->ListRoles(account_id)) {
    auto carried = SplitList(role.permissions);
    granted.insert(granted.end(), carried.begin(), carried.end());
  }
  return granted;
}

void AuthorizationService::CheckPermissions(const Account& account, const std::vector<std::string>& required) const {
  auto granted = GrantedPermissions(account.id);
  for (const auto& wildcard : granted) {
    for (const auto& needed : required) {
      if (WildcardMatches(wildcard, needed)) {
        return;
      }
    }
  }
  throw errors::InsufficientPermission();
}

AuthenticatedSession AuthorizationService::RequireRoles(const RequestContext& ctx, const std::string& token,
                                                        const std::vector<std::string>& roles) const {
  auto authenticated = authentication_->Authenticate(ctx, token);
  CheckRoles(authenticated.account, roles);
  return authenticated;
}

AuthenticatedSession AuthorizationService::RequirePermissions(const RequestContext& ctx, const std::string& token,
                                                              const std::vector<std::string>& required) const {
  auto authenticated = authentication_->Authenticate(ctx, token);
  CheckPermissions(authenticated.account, required);
  return authenticated;
}

}  // namespace warden
