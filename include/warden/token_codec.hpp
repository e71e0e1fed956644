/*
 * 설명: 세션 토큰(HS256 JWT) 인코딩/디코딩을 담당한다. 만료 판단은 하지 않는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/token_codec_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>

namespace warden {

struct TokenClaims {
  std::int64_t issued_at{0};
  std::string session_id;
  std::string ip;
};

class TokenCodec {
 public:
  explicit TokenCodec(std::string secret);

  std::string Encode(const TokenClaims& claims) const;
  // 형식 오류, 서명 누락, 다른 비밀키로 서명된 토큰은 errors::Decode()를 던진다.
  TokenClaims Decode(const std::string& token) const;

 private:
  std::string Sign(const std::string& signing_input) const;

  std::string secret_;
};

}  // namespace warden
