/*
 * 설명: OpenSSL PBKDF2-HMAC-SHA256으로 비밀번호를 해시하고 상수 시간으로 비교한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/password_hasher_test.cpp
 */
#include "warden/password_hasher.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace warden {

namespace {
constexpr const char* kScheme = "pbkdf2_sha256";
constexpr std::size_t kSaltBytes = 16;
constexpr std::size_t kHashBytes = 32;

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool HexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
  if (hex.empty() || hex.size() % 2 != 0) {
    return false;
  }
  out.clear();
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    unsigned int byte;
    std::istringstream iss(hex.substr(i, 2));
    iss >> std::hex >> byte;
    if (iss.fail()) {
      return false;
    }
    out.push_back(static_cast<unsigned char>(byte));
  }
  return true;
}

struct EncodedHash {
  unsigned int iterations;
  std::string salt_hex;
  std::string hash_hex;
};

std::optional<EncodedHash> ParseEncoded(const std::string& encoded) {
  std::vector<std::string> parts;
  std::istringstream iss(encoded);
  std::string part;
  while (std::getline(iss, part, '$')) {
    parts.push_back(part);
  }
  if (parts.size() != 4 || parts[0] != kScheme) {
    return std::nullopt;
  }
  try {
    unsigned long iterations = std::stoul(parts[1]);
    if (iterations == 0) {
      return std::nullopt;
    }
    return EncodedHash{static_cast<unsigned int>(iterations), parts[2], parts[3]};
  } catch (const std::exception&) {
    return std::nullopt;
  }
}
}  // namespace

Pbkdf2PasswordHasher::Pbkdf2PasswordHasher(unsigned int iterations) : iterations_(iterations) {
  if (iterations_ == 0) {
    throw std::invalid_argument("PBKDF2 반복 횟수는 0일 수 없습니다");
  }
}

std::string Pbkdf2PasswordHasher::Hash(const std::string& password) const {
  unsigned char salt[kSaltBytes];
  if (RAND_bytes(salt, sizeof(salt)) != 1) {
    throw std::runtime_error("salt 생성 실패");
  }
  std::string salt_hex = BytesToHex(salt, sizeof(salt));
  std::ostringstream oss;
  oss << kScheme << '$' << iterations_ << '$' << salt_hex << '$' << Derive(password, salt_hex, iterations_);
  return oss.str();
}

bool Pbkdf2PasswordHasher::Verify(const std::string& encoded, const std::string& password) const {
  auto parsed = ParseEncoded(encoded);
  if (!parsed) {
    return false;
  }
  auto computed = Derive(password, parsed->salt_hex, parsed->iterations);
  if (computed.empty() || computed.size() != parsed->hash_hex.size()) {
    return false;
  }
  return CRYPTO_memcmp(computed.data(), parsed->hash_hex.data(), computed.size()) == 0;
}

bool Pbkdf2PasswordHasher::NeedsRehash(const std::string& encoded) const {
  auto parsed = ParseEncoded(encoded);
  return !parsed || parsed->iterations != iterations_;
}

std::string Pbkdf2PasswordHasher::Derive(const std::string& password, const std::string& salt_hex,
                                         unsigned int iterations) const {
  std::vector<unsigned char> salt;
  if (!HexToBytes(salt_hex, salt)) {
    return {};
  }
  std::vector<unsigned char> output(kHashBytes);
  if (PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.size()), salt.data(),
                        static_cast<int>(salt.size()), static_cast<int>(iterations), EVP_sha256(),
                        static_cast<int>(output.size()), output.data()) != 1) {
    throw std::runtime_error("PBKDF2 계산 실패");
  }
  return BytesToHex(output.data(), output.size());
}

}  // namespace warden
