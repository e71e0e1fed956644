/*
 * 설명: 세션 종류 이름/쿠키 매핑과 계정/세션의 JSON 직렬화를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/session_factory_test.cpp, tests/unit/models_test.cpp
 */
#include "warden/models.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace warden {

std::string_view SessionKindName(SessionKind kind) {
  switch (kind) {
    case SessionKind::kAuthentication:
      return "authentication";
    case SessionKind::kVerification:
      return "verification";
    case SessionKind::kTwoStep:
      return "two_step";
    case SessionKind::kCaptcha:
      return "captcha";
  }
  return "unknown";
}

std::optional<SessionKind> ParseSessionKind(std::string_view name) {
  for (auto kind : {SessionKind::kAuthentication, SessionKind::kVerification, SessionKind::kTwoStep,
                    SessionKind::kCaptcha}) {
    if (SessionKindName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string_view CookieName(SessionKind kind) {
  switch (kind) {
    case SessionKind::kAuthentication:
      return "authtkn";
    case SessionKind::kVerification:
      return "veritkn";
    case SessionKind::kTwoStep:
      return "twostkn";
    case SessionKind::kCaptcha:
      return "captkn";
  }
  return "tkn";
}

const std::string* SessionRecord::Code() const {
  if (const auto* challenge = std::get_if<ChallengeState>(&payload)) {
    return &challenge->code;
  }
  return nullptr;
}

AuthenticationState* SessionRecord::Authentication() { return std::get_if<AuthenticationState>(&payload); }

const AuthenticationState* SessionRecord::Authentication() const {
  return std::get_if<AuthenticationState>(&payload);
}

std::string ToIsoString(Clock::time_point tp) {
  auto tt = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json AccountToJson(const Account& account) {
  nlohmann::json j;
  j["id"] = account.id;
  j["date_created"] = ToIsoString(account.date_created);
  j["date_updated"] = ToIsoString(account.date_updated);
  j["email"] = account.email;
  j["username"] = account.username;
  j["phone"] = account.phone ? nlohmann::json(*account.phone) : nlohmann::json(nullptr);
  j["disabled"] = account.disabled;
  j["verified"] = account.verified;
  return j;
}

nlohmann::json SessionToJson(const SessionRecord& session) {
  nlohmann::json j;
  j["id"] = session.id;
  j["kind"] = std::string(SessionKindName(session.kind));
  j["date_created"] = ToIsoString(session.date_created);
  j["expiration_date"] = ToIsoString(session.expiration_date);
  j["valid"] = session.valid;
  j["attempts"] = session.attempts;
  std::visit(
      [&j](const auto& state) {
        using T = std::decay_t<decltype(state)>;
        if constexpr (std::is_same_v<T, AuthenticationState>) {
          j["two_factor"] = state.two_factor;
          j["active"] = state.active;
        }
      },
      session.payload);
  return j;
}

}  // namespace warden
