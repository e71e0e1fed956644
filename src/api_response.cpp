/*
 * 설명: JSON 응답 엔벨로프를 생성하고 인증 오류를 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/json_envelope_test.cpp
 */
#include "warden/api_response.hpp"

#include "warden/models.hpp"

namespace warden {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(Clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", std::string(code)}, {"message", std::string(message)}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(Clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(const AuthError& error) {
  auto envelope = MakeErrorEnvelope(error.code, error.what());
  envelope["error"]["detail"] = {{"kind", std::string(ErrorKindName(error.kind))}, {"status", error.status}};
  return envelope;
}

}  // namespace warden
