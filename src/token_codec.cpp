/*
 * 설명: OpenSSL HMAC-SHA256과 base64url로 세션 토큰을 서명/검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/token_codec_test.cpp
 */
#include "warden/token_codec.hpp"

#include <stdexcept>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "warden/errors.hpp"

namespace warden {

namespace {
std::string Base64UrlEncode(const std::string& input) {
  if (input.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                            static_cast<int>(input.size()));
  std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  return encoded;
}

bool Base64UrlDecode(const std::string& input, std::string& out) {
  if (input.empty() || input.size() % 4 == 1) {
    return false;
  }
  std::string padded = input;
  for (auto& c : padded) {
    if (c == '-') {
      c = '+';
    } else if (c == '_') {
      c = '/';
    } else if (c == '+' || c == '/' || c == '=') {
      return false;
    }
  }
  std::size_t pad = (4 - padded.size() % 4) % 4;
  padded.append(pad, '=');
  std::vector<unsigned char> buffer(padded.size() / 4 * 3 + 1);
  int len = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                            static_cast<int>(padded.size()));
  if (len < 0 || static_cast<std::size_t>(len) < pad) {
    return false;
  }
  out.assign(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len) - pad);
  return true;
}

const std::string& EncodedHeader() {
  static const std::string header = Base64UrlEncode(nlohmann::json{{"alg", "HS256"}, {"typ", "JWT"}}.dump());
  return header;
}
}  // namespace

TokenCodec::TokenCodec(std::string secret) : secret_(std::move(secret)) {
  if (secret_.empty()) {
    throw std::invalid_argument("토큰 서명 비밀키가 비어 있습니다");
  }
}

std::string TokenCodec::Encode(const TokenClaims& claims) const {
  nlohmann::json payload{{"iat", claims.issued_at}, {"uid", claims.session_id}, {"ip", claims.ip}};
  std::string signing_input = EncodedHeader() + "." + Base64UrlEncode(payload.dump());
  return signing_input + "." + Sign(signing_input);
}

TokenClaims TokenCodec::Decode(const std::string& token) const {
  auto first = token.find('.');
  auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
    throw errors::Decode();
  }
  std::string signing_input = token.substr(0, second);
  std::string signature = token.substr(second + 1);
  std::string expected = Sign(signing_input);
  if (signature.size() != expected.size() ||
      CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    throw errors::Decode();
  }

  std::string header_text;
  std::string payload_text;
  if (!Base64UrlDecode(token.substr(0, first), header_text) ||
      !Base64UrlDecode(token.substr(first + 1, second - first - 1), payload_text)) {
    throw errors::Decode();
  }
  auto header = nlohmann::json::parse(header_text, nullptr, false);
  auto payload = nlohmann::json::parse(payload_text, nullptr, false);
  if (header.is_discarded() || payload.is_discarded() || !header.is_object() || !payload.is_object()) {
    throw errors::Decode();
  }
  if (header.value("alg", "") != "HS256") {
    throw errors::Decode();
  }
  if (!payload.contains("uid") || !payload["uid"].is_string() || !payload.contains("iat") ||
      !payload["iat"].is_number_integer() || !payload.contains("ip") || !payload["ip"].is_string()) {
    throw errors::Decode();
  }
  TokenClaims claims;
  claims.issued_at = payload["iat"].get<std::int64_t>();
  claims.session_id = payload["uid"].get<std::string>();
  claims.ip = payload["ip"].get<std::string>();
  return claims;
}

std::string TokenCodec::Sign(const std::string& signing_input) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
            reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), digest,
            &digest_len)) {
    throw std::runtime_error("HMAC 계산 실패");
  }
  return Base64UrlEncode(std::string(reinterpret_cast<const char*>(digest), digest_len));
}

}  // namespace warden
