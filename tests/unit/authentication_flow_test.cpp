#include <gtest/gtest.h>

#include <string>

#include "flow_fixture.hpp"

using warden::ErrorKind;
using warden::RegistrationForm;
using warden_test::kPassword;
using warden_test::ThrownKind;
using warden_test::ThrownStatus;

TEST(AuthenticationFlowTest, RegistrationRejectsMalformedInput) {
  warden_test::FlowFixture fx;
  auto reg = [&](RegistrationForm form) { return [&fx, form] { fx.authentication->Register(form); }; };

  EXPECT_EQ(ThrownStatus(reg({"not-an-email", "user_one", kPassword, std::nullopt})), 400);
  EXPECT_EQ(ThrownStatus(reg({"user@example.com", "ab", kPassword, std::nullopt})), 400);
  EXPECT_EQ(ThrownStatus(reg({"user@example.com", "has space", kPassword, std::nullopt})), 400);
  EXPECT_EQ(ThrownStatus(reg({"user@example.com", "user_one", kPassword, std::string("12345")})), 400);
  EXPECT_EQ(ThrownStatus(reg({"user@example.com", "user_one", "12345678", std::nullopt})), 400);
  EXPECT_EQ(ThrownStatus(reg({"user@example.com", "user_one", std::string(100, 'p'), std::nullopt})), 400);
  EXPECT_EQ(fx.repository->AccountCount(), 0u);
}

TEST(AuthenticationFlowTest, PasswordLengthBounds) {
  EXPECT_EQ(ThrownKind([] { warden::ValidatePassword(std::string(8, 'p')); }), ErrorKind::kCredentials);
  EXPECT_EQ(ThrownKind([] { warden::ValidatePassword(std::string(9, 'p')); }), std::nullopt);
  EXPECT_EQ(ThrownKind([] { warden::ValidatePassword(std::string(99, 'p')); }), std::nullopt);
  EXPECT_EQ(ThrownKind([] { warden::ValidatePassword(std::string(100, 'p')); }), ErrorKind::kCredentials);
}

TEST(AuthenticationFlowTest, RegistrationStoresLowercasedEmailAndHash) {
  warden_test::FlowFixture fx;
  auto account = fx.authentication->Register({"User@Example.COM", "user_one", kPassword, std::string("821012345678")});
  EXPECT_EQ(account.email, "user@example.com");
  EXPECT_FALSE(account.verified);
  EXPECT_NE(account.password_hash, kPassword);
  EXPECT_TRUE(fx.hasher->Verify(account.password_hash, kPassword));
}

TEST(AuthenticationFlowTest, DuplicateRegistrationIsGeneric409) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified();
  try {
    fx.authentication->Register({"USER@example.com", "someone_else", kPassword, std::nullopt});
    FAIL() << "duplicate email must be rejected";
  } catch (const warden::AuthError& ex) {
    EXPECT_EQ(ex.kind, ErrorKind::kCredentials);
    EXPECT_EQ(ex.status, 409);
    EXPECT_EQ(ex.code, "credentials_exist");
  }
  EXPECT_EQ(fx.repository->AccountCount(), 1u);
}

TEST(AuthenticationFlowTest, IncorrectPasswordIsCountedAndLogged) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified();
  EXPECT_EQ(ThrownStatus([&] { fx.authentication->Login(fx.Ctx(), "user@example.com", "wrong-password"); }), 401);
  EXPECT_EQ(fx.observability->Snapshot().rejected_authentications, 1u);
  EXPECT_EQ(fx.observability->Snapshot().logins, 0u);
  EXPECT_NE(fx.log.str().find("auth.login.incorrect_password"), std::string::npos);
}

TEST(AuthenticationFlowTest, UnverifiedAndDisabledAccountsCannotLogin) {
  warden_test::FlowFixture fx;
  fx.authentication->Register({"fresh@example.com", "fresh_user", kPassword, std::nullopt});
  fx.authentication->Register({"off@example.com", "off_user", kPassword, std::nullopt}, true, true);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Login(fx.Ctx(), "fresh@example.com", kPassword); }),
            ErrorKind::kAccount);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Login(fx.Ctx(), "off@example.com", kPassword); }),
            ErrorKind::kAccount);
}

TEST(AuthenticationFlowTest, UnknownIdentifierIsNotFound) {
  warden_test::FlowFixture fx;
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Login(fx.Ctx(), "ghost@example.com", kPassword); }),
            ErrorKind::kNotFound);
}

TEST(AuthenticationFlowTest, UsernameLoginOnlyWhenEnabled) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified("user@example.com", "user_one");
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Login(fx.Ctx(), "user_one", kPassword); }), ErrorKind::kNotFound);

  warden::AuthenticationService by_username(fx.repository, fx.hasher, fx.engine, fx.factory, fx.observability, true);
  auto issued = by_username.Login(fx.Ctx(), "user_one", kPassword);
  EXPECT_TRUE(issued.session.account_id.has_value());
}

TEST(AuthenticationFlowTest, LoginRehashesOutdatedPasswordHash) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto stronger = std::make_shared<warden::Pbkdf2PasswordHasher>(warden_test::kTestIterations * 2);
  ASSERT_TRUE(stronger->NeedsRehash(account.password_hash));

  warden::AuthenticationService upgraded(fx.repository, stronger, fx.engine, fx.factory, fx.observability, false);
  upgraded.Login(fx.Ctx(), "user@example.com", kPassword);
  auto stored = fx.repository->FindAccountById(account.id);
  EXPECT_FALSE(stronger->NeedsRehash(stored->password_hash));
  EXPECT_TRUE(stronger->Verify(stored->password_hash, kPassword));
}

TEST(AuthenticationFlowTest, LoginThenAuthenticateSucceeds) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword);
  auto authenticated = fx.authentication->Authenticate(fx.Ctx(), issued.token);
  EXPECT_EQ(authenticated.account.id, account.id);
  EXPECT_EQ(authenticated.session.id, issued.session.id);
  EXPECT_EQ(fx.observability->Snapshot().logins, 1u);
}

TEST(AuthenticationFlowTest, LogoutDeactivatesButKeepsSessionValid) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword);
  auto logged_out = fx.authentication->Logout(issued.session);
  EXPECT_FALSE(logged_out.Authentication()->active);
  EXPECT_TRUE(logged_out.valid);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx(), issued.token); }), ErrorKind::kDeactivated);
}

TEST(AuthenticationFlowTest, SecondFactorBlocksUntilFulfilled) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword, true);
  EXPECT_EQ(ThrownStatus([&] { fx.authentication->Authenticate(fx.Ctx(), issued.token); }), 401);

  auto challenge = fx.verification->RequestTwoStepVerification(fx.Ctx(), account);
  auto two_step = fx.verification->RequiresTwoStepVerification(fx.Ctx(), challenge.token, "482913");
  auto cleared = fx.authentication->OnSecondFactor(two_step, issued.token);
  EXPECT_FALSE(cleared.Authentication()->two_factor);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx(), issued.token); }), std::nullopt);

  EXPECT_EQ(ThrownStatus([&] { fx.authentication->OnSecondFactor(two_step, issued.token); }), 403);
}

TEST(AuthenticationFlowTest, SecondFactorNeedsConsumedTwoStepSession) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword, true);
  auto challenge = fx.verification->RequestTwoStepVerification(fx.Ctx(), account);

  EXPECT_EQ(ThrownKind([&] { fx.authentication->OnSecondFactor(challenge.session, issued.token); }),
            ErrorKind::kInvalid);
  EXPECT_TRUE(fx.repository->FindSession(issued.session.id)->Authentication()->two_factor);
}

TEST(AuthenticationFlowTest, SecondFactorFromAnotherAccountIsRejected) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified("victim@example.com", "victim");
  auto attacker = fx.RegisterVerified("mallory@example.com", "mallory");
  auto victim = fx.authentication->Login(fx.Ctx(), "victim@example.com", kPassword, true);

  auto challenge = fx.verification->RequestTwoStepVerification(fx.Ctx(), attacker);
  auto two_step = fx.verification->RequiresTwoStepVerification(fx.Ctx(), challenge.token, "482913");
  EXPECT_EQ(ThrownStatus([&] { fx.authentication->OnSecondFactor(two_step, victim.token); }), 403);
  EXPECT_NE(fx.log.str().find("auth.second_factor.account_mismatch"), std::string::npos);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx(), victim.token); }), ErrorKind::kSecondFactor);
}

TEST(AuthenticationFlowTest, UnknownLocationIsRejectedAndLogged) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx("1.2.3.4"), "user@example.com", kPassword);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx("9.9.9.9"), issued.token); }),
            ErrorKind::kUnknownLocation);
  EXPECT_EQ(fx.observability->Snapshot().rejected_authentications, 1u);
  EXPECT_NE(fx.log.str().find("auth.unknown_location"), std::string::npos);
}

TEST(AuthenticationFlowTest, RefreshIssuesNewSessionForSameAccount) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword);
  auto refreshed = fx.authentication->RefreshAuthentication(fx.Ctx(), issued.token);
  EXPECT_NE(refreshed.session.id, issued.session.id);
  EXPECT_EQ(refreshed.session.account_id, account.id);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx(), refreshed.token); }), std::nullopt);
}

TEST(AuthenticationFlowTest, RefreshFromUnknownLocationIsRejected) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx("1.2.3.4"), "user@example.com", kPassword);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->RefreshAuthentication(fx.Ctx("9.9.9.9"), issued.token); }),
            ErrorKind::kUnknownLocation);
  EXPECT_TRUE(fx.repository->ListAuthenticationSessions(account.id, std::string("9.9.9.9")).empty());
}

TEST(AuthenticationFlowTest, RefreshKeepsPendingSecondFactor) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword, true);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->RefreshAuthentication(fx.Ctx(), issued.token); }),
            ErrorKind::kSecondFactor);
  EXPECT_EQ(fx.repository->ListAuthenticationSessions(account.id, std::nullopt).size(), 1u);
}

TEST(AuthenticationFlowTest, RefreshOfLoggedOutSessionFails) {
  warden_test::FlowFixture fx;
  fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword);
  fx.authentication->Logout(issued.session);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->RefreshAuthentication(fx.Ctx(), issued.token); }),
            ErrorKind::kDeactivated);
}

TEST(AuthenticationFlowTest, DeletedAccountCannotAuthenticate) {
  warden_test::FlowFixture fx;
  auto account = fx.RegisterVerified();
  auto issued = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword);
  fx.repository->MarkAccountDeleted(account.id);
  EXPECT_EQ(ThrownKind([&] { fx.authentication->Authenticate(fx.Ctx(), issued.token); }), ErrorKind::kNotFound);
}

TEST(AuthenticationFlowTest, InitialAdminIsCreatedOnce) {
  warden_test::FlowFixture fx;
  auto admin = fx.authentication->GenerateInitialAdmin("Admin@Example.com", kPassword);
  EXPECT_EQ(admin.username, warden::kHeadAdminName);
  EXPECT_EQ(admin.email, "admin@example.com");
  EXPECT_TRUE(admin.verified);

  auto roles = fx.repository->ListRoles(admin.id);
  ASSERT_EQ(roles.size(), 1u);
  EXPECT_EQ(roles[0].name, warden::kHeadAdminName);
  EXPECT_EQ(roles[0].permissions, "*:*");

  auto again = fx.authentication->GenerateInitialAdmin("admin@example.com", kPassword);
  EXPECT_EQ(again.id, admin.id);
  EXPECT_EQ(fx.repository->AccountCount(), 1u);
  EXPECT_EQ(fx.repository->ListRoles(admin.id).size(), 1u);
}
