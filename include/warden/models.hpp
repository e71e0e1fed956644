/*
 * 설명: 계정, 세션(종류별 페이로드), 역할/권한 레코드를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_engine_test.cpp, tests/unit/session_factory_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace warden {

using Clock = std::chrono::system_clock;

struct Account {
  std::int64_t id{0};
  std::string username;
  std::string email;
  std::optional<std::string> phone;
  std::string password_hash;
  bool disabled{false};
  bool verified{false};
  bool deleted{false};
  Clock::time_point date_created{};
  Clock::time_point date_updated{};
};

struct NewAccount {
  std::string username;
  std::string email;
  std::optional<std::string> phone;
  std::string password_hash;
  bool verified{false};
  bool disabled{false};
};

enum class SessionKind { kAuthentication, kVerification, kTwoStep, kCaptcha };

std::string_view SessionKindName(SessionKind kind);
std::optional<SessionKind> ParseSessionKind(std::string_view name);
std::string_view CookieName(SessionKind kind);

struct AuthenticationState {
  bool two_factor{false};
  bool active{true};
};

// verification, two-step, captcha 세션이 공유한다.
struct ChallengeState {
  std::string code;
};

using SessionPayload = std::variant<AuthenticationState, ChallengeState>;

constexpr int kMaxCrosscheckAttempts = 5;

struct SessionRecord {
  std::string id;
  SessionKind kind{SessionKind::kAuthentication};
  std::optional<std::int64_t> account_id;
  Clock::time_point date_created{};
  Clock::time_point expiration_date{};
  bool valid{true};
  std::string ip;
  int attempts{0};
  bool deleted{false};
  SessionPayload payload{AuthenticationState{}};

  bool IsExpired(Clock::time_point now) const { return now > expiration_date; }
  const std::string* Code() const;
  AuthenticationState* Authentication();
  const AuthenticationState* Authentication() const;
};

// 코어 호출에 넘기는 요청 단위 정보. 전송 계층 객체는 들어오지 않는다.
struct RequestContext {
  std::string ip;
  std::string trace_id;
};

struct Role {
  std::int64_t id{0};
  std::string name;
  std::string description;
  std::string permissions;
};

struct Permission {
  std::int64_t id{0};
  std::int64_t account_id{0};
  std::string wildcard;
};

std::string ToIsoString(Clock::time_point tp);

nlohmann::json AccountToJson(const Account& account);
nlohmann::json SessionToJson(const SessionRecord& session);

}  // namespace warden
