/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "warden/errors.hpp"

namespace warden {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);
nlohmann::json MakeErrorEnvelope(const AuthError& error);

}  // namespace warden
