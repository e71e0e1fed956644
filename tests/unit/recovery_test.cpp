#include <gtest/gtest.h>

#include "flow_fixture.hpp"

using warden::ErrorKind;
using warden_test::kPassword;
using warden_test::ThrownKind;

TEST(RecoveryTest, RecoveryReplacesPasswordAndRevokesSessions) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto first = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword);
  auto second = fx.authentication->Login(fx.Ctx("5.6.7.8"), "user@example.com", kPassword);

  auto attempt = fx.recovery->AttemptAccountRecovery(fx.Ctx(), "USER@example.com");
  EXPECT_EQ(attempt.session.kind, warden::SessionKind::kTwoStep);
  EXPECT_EQ(attempt.session.account_id, account.id);
  ASSERT_EQ(fx.delivery->messages.size(), 1u);

  auto two_step = fx.verification->RequiresTwoStepVerification(fx.Ctx(), attempt.token, "482913");
  EXPECT_EQ(fx.recovery->FulfillAccountRecoveryAttempt(two_step, "a-brand-new-password"), 2u);

  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx(), first.token); }), ErrorKind::kInvalid);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx("5.6.7.8"), second.token); }),
            ErrorKind::kInvalid);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword); }),
            ErrorKind::kCredentials);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Login(fx.Ctx(), "user@example.com", "a-brand-new-password"); }),
            std::nullopt);
}

TEST(RecoveryTest, UnknownEmailIsNotFound) {
  warden_test::FlowFixture fx;
  EXPECT_EQ(ThrownKind([&] { fx.recovery->AttemptAccountRecovery(fx.Ctx(), "ghost@example.com"); }),
            ErrorKind::kNotFound);
  EXPECT_TRUE(fx.delivery->messages.empty());
}

TEST(RecoveryTest, DisabledAccountCannotRecover) {
  warden_test::FlowFixture fx;
  fx.authentication->Register({"off@example.com", "off_user", kPassword, std::nullopt}, true, true);
  EXPECT_EQ(ThrownKind([&] { fx.recovery->AttemptAccountRecovery(fx.Ctx(), "off@example.com"); }),
            ErrorKind::kAccount);
}

TEST(RecoveryTest, NewPasswordMustBeValid) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto attempt = fx.recovery->AttemptAccountRecovery(fx.Ctx(), "user@example.com");
  auto two_step = fx.verification->RequiresTwoStepVerification(fx.Ctx(), attempt.token, "482913");
  EXPECT_EQ(warden_test::ThrownStatus([&] { fx.recovery->FulfillAccountRecoveryAttempt(two_step, "short"); }), 400);
  EXPECT_TRUE(fx.hasher->Verify(fx.repository->FindAccountById(account.id)->password_hash, kPassword));
}
