#include <gtest/gtest.h>

#include <stdexcept>

#include "warden/password_hasher.hpp"

TEST(PasswordHasherTest, VerifiesOnlyTheOriginalPassword) {
  warden::Pbkdf2PasswordHasher hasher(1000);
  auto encoded = hasher.Hash("correct-horse-battery");
  EXPECT_EQ(encoded.rfind("pbkdf2_sha256$1000$", 0), 0u);
  EXPECT_TRUE(hasher.Verify(encoded, "correct-horse-battery"));
  EXPECT_FALSE(hasher.Verify(encoded, "correct-horse-batterY"));
}

TEST(PasswordHasherTest, SaltMakesEveryHashDistinct) {
  warden::Pbkdf2PasswordHasher hasher(1000);
  EXPECT_NE(hasher.Hash("same-password"), hasher.Hash("same-password"));
}

TEST(PasswordHasherTest, GarbageHashNeverVerifies) {
  warden::Pbkdf2PasswordHasher hasher(1000);
  EXPECT_FALSE(hasher.Verify("", "x"));
  EXPECT_FALSE(hasher.Verify("plaintext", "plaintext"));
  EXPECT_FALSE(hasher.Verify("pbkdf2_sha256$abc$00$00", "x"));
  EXPECT_FALSE(hasher.Verify("pbkdf2_sha256$1000$zz$00", "x"));
  EXPECT_TRUE(hasher.NeedsRehash("plaintext"));
}

TEST(PasswordHasherTest, IterationChangeRequiresRehash) {
  warden::Pbkdf2PasswordHasher old_hasher(1000);
  warden::Pbkdf2PasswordHasher new_hasher(1500);
  auto encoded = old_hasher.Hash("correct-horse-battery");
  EXPECT_FALSE(old_hasher.NeedsRehash(encoded));
  EXPECT_TRUE(new_hasher.NeedsRehash(encoded));
  EXPECT_TRUE(new_hasher.Verify(encoded, "correct-horse-battery"));
}

TEST(PasswordHasherTest, ZeroIterationsIsRejected) {
  EXPECT_THROW(warden::Pbkdf2PasswordHasher(0), std::invalid_argument);
}
