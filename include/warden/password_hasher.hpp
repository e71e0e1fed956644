/*
 * 설명: 비밀번호 단방향 해시/검증/재해시 판단 인터페이스와 PBKDF2 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/password_hasher_test.cpp
 */
#pragma once

#include <string>

namespace warden {

class PasswordHasher {
 public:
  virtual ~PasswordHasher() = default;

  virtual std::string Hash(const std::string& password) const = 0;
  virtual bool Verify(const std::string& encoded, const std::string& password) const = 0;
  virtual bool NeedsRehash(const std::string& encoded) const = 0;
};

// 저장 형식: pbkdf2_sha256$<iterations>$<salt hex>$<hash hex>
class Pbkdf2PasswordHasher : public PasswordHasher {
 public:
  explicit Pbkdf2PasswordHasher(unsigned int iterations);

  std::string Hash(const std::string& password) const override;
  bool Verify(const std::string& encoded, const std::string& password) const override;
  bool NeedsRehash(const std::string& encoded) const override;

  unsigned int iterations() const { return iterations_; }

 private:
  std::string Derive(const std::string& password, const std::string& salt_hex, unsigned int iterations) const;

  unsigned int iterations_;
};

}  // namespace warden
