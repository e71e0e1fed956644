#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "flow_fixture.hpp"

using warden::ErrorKind;
using warden::SessionKind;
using warden_test::ThrownKind;

namespace {
warden::SessionRecord ChallengeSession(const std::string& code) {
  warden::SessionRecord session;
  session.id = "manual";
  session.kind = SessionKind::kVerification;
  session.date_created = warden::Clock::now();
  session.expiration_date = session.date_created + std::chrono::minutes(1);
  session.payload = warden::ChallengeState{code};
  return session;
}
}  // namespace

class SessionEngineTest : public ::testing::Test {
 protected:
  warden_test::FlowFixture fx;
  warden::Account account = fx.RegisterVerified();

  warden::IssuedSession IssueVerification() {
    return fx.factory->Issue(SessionKind::kVerification, fx.Ctx(), account);
  }
};

TEST_F(SessionEngineTest, FourMisses_ThenCorrectCodeConsumesSession) {
  auto issued = IssueVerification();
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(ThrownKind([&] { fx.engine->Crosscheck(issued.session, "000000"); }), ErrorKind::kCrosscheck);
  }
  EXPECT_EQ(fx.repository->FindSession(issued.session.id)->attempts, 4);

  auto consumed = fx.engine->Crosscheck(issued.session, "482913");
  EXPECT_FALSE(consumed.valid);
  EXPECT_EQ(consumed.attempts, 4);
  EXPECT_FALSE(fx.repository->FindSession(issued.session.id)->valid);
}

TEST_F(SessionEngineTest, SixthAttemptFailsEvenWithCorrectCode) {
  auto issued = IssueVerification();
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(ThrownKind([&] { fx.engine->Crosscheck(issued.session, "999999"); }), ErrorKind::kCrosscheck);
  }
  EXPECT_EQ(ThrownKind([&] { fx.engine->Crosscheck(issued.session, "482913"); }), ErrorKind::kMaximumAttempts);
  auto stored = fx.repository->FindSession(issued.session.id);
  EXPECT_EQ(stored->attempts, 5);
  EXPECT_TRUE(stored->valid);
}

TEST_F(SessionEngineTest, ConsumedSessionCannotBeReused) {
  auto issued = IssueVerification();
  fx.engine->Crosscheck(issued.session, "482913");
  EXPECT_EQ(ThrownKind([&] { fx.engine->Crosscheck(issued.session, "482913"); }), ErrorKind::kInvalid);
}

TEST_F(SessionEngineTest, WrongLengthCodeCountsAsMiss) {
  auto issued = IssueVerification();
  EXPECT_EQ(ThrownKind([&] { fx.engine->Crosscheck(issued.session, "48291"); }), ErrorKind::kCrosscheck);
  EXPECT_EQ(ThrownKind([&] { fx.engine->Crosscheck(issued.session, ""); }), ErrorKind::kCrosscheck);
  EXPECT_EQ(fx.repository->FindSession(issued.session.id)->attempts, 2);
}

TEST_F(SessionEngineTest, ConcurrentMissesNeverExceedAttemptLimit) {
  auto issued = IssueVerification();
  std::atomic<int> crosscheck_failures{0};
  std::atomic<int> exhausted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 10; ++i) {
    threads.emplace_back([&] {
      auto kind = ThrownKind([&] { fx.engine->Crosscheck(issued.session, "000000"); });
      if (kind == ErrorKind::kCrosscheck) {
        ++crosscheck_failures;
      } else if (kind == ErrorKind::kMaximumAttempts) {
        ++exhausted;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(crosscheck_failures.load(), warden::kMaxCrosscheckAttempts);
  EXPECT_EQ(exhausted.load(), 10 - warden::kMaxCrosscheckAttempts);
  EXPECT_EQ(fx.repository->FindSession(issued.session.id)->attempts, warden::kMaxCrosscheckAttempts);
}

TEST_F(SessionEngineTest, DecodeResolvesStoredSession) {
  auto issued = IssueVerification();
  auto decoded = fx.engine->Decode(SessionKind::kVerification, issued.token);
  EXPECT_EQ(decoded.id, issued.session.id);
  EXPECT_EQ(decoded.account_id, account.id);
  EXPECT_EQ(*decoded.Code(), "482913");
}

TEST_F(SessionEngineTest, DecodeWithWrongKindIsNotFound) {
  auto issued = IssueVerification();
  EXPECT_EQ(ThrownKind([&] { fx.engine->Decode(SessionKind::kTwoStep, issued.token); }), ErrorKind::kNotFound);
}

TEST_F(SessionEngineTest, DecodeOfDeletedSessionIsNotFound) {
  auto issued = IssueVerification();
  fx.repository->MarkSessionDeleted(issued.session.id);
  EXPECT_EQ(ThrownKind([&] { fx.engine->Decode(SessionKind::kVerification, issued.token); }), ErrorKind::kNotFound);
}

TEST_F(SessionEngineTest, DecodeWithMissingTokenIsNotFound) {
  EXPECT_EQ(ThrownKind([&] { fx.engine->Decode(SessionKind::kVerification, ""); }), ErrorKind::kNotFound);
}

TEST_F(SessionEngineTest, DecodeAfterSecretRotationFails) {
  auto issued = IssueVerification();
  warden::SessionEngine rotated(fx.repository, std::make_shared<warden::TokenCodec>("another-secret"));
  EXPECT_EQ(ThrownKind([&] { rotated.Decode(SessionKind::kVerification, issued.token); }), ErrorKind::kDecode);
}

TEST_F(SessionEngineTest, ValidateChecksInOrder) {
  auto now = warden::Clock::now();
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(std::nullopt, now); }), ErrorKind::kNotFound);

  auto session = ChallengeSession("482913");
  session.deleted = true;
  session.valid = false;
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(session, now); }), ErrorKind::kNotFound);

  session.deleted = false;
  session.expiration_date = now - std::chrono::minutes(5);
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(session, now); }), ErrorKind::kInvalid);

  session.valid = true;
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(session, now); }), ErrorKind::kExpired);

  session.expiration_date = now + std::chrono::minutes(5);
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(session, now); }), std::nullopt);
}

TEST_F(SessionEngineTest, LoggedOutSessionIsDeactivatedBeforeExpired) {
  auto now = warden::Clock::now();
  warden::SessionRecord session;
  session.id = "auth";
  session.kind = SessionKind::kAuthentication;
  session.expiration_date = now - std::chrono::hours(1);
  session.payload = warden::AuthenticationState{false, false};
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(session, now); }), ErrorKind::kDeactivated);
}

TEST_F(SessionEngineTest, ExpiryIsEvaluatedAgainstGivenTime) {
  auto issued = IssueVerification();
  auto later = issued.session.expiration_date + std::chrono::seconds(1);
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(issued.session, issued.session.date_created); }), std::nullopt);
  EXPECT_EQ(ThrownKind([&] { fx.engine->Validate(issued.session, later); }), ErrorKind::kExpired);
}

TEST_F(SessionEngineTest, ValidateAccountChecksInOrder) {
  EXPECT_EQ(ThrownKind([&] { fx.engine->ValidateAccount(std::nullopt); }), ErrorKind::kNotFound);

  warden::Account candidate = account;
  candidate.deleted = true;
  candidate.disabled = true;
  candidate.verified = false;
  auto status = warden_test::ThrownStatus([&] { fx.engine->ValidateAccount(candidate); });
  EXPECT_EQ(status, 404);

  candidate.deleted = false;
  try {
    fx.engine->ValidateAccount(candidate);
    FAIL() << "disabled account must be rejected";
  } catch (const warden::AuthError& ex) {
    EXPECT_EQ(ex.code, "account_disabled");
  }

  candidate.disabled = false;
  try {
    fx.engine->ValidateAccount(candidate);
    FAIL() << "unverified account must be rejected";
  } catch (const warden::AuthError& ex) {
    EXPECT_EQ(ex.code, "account_unverified");
  }

  candidate.verified = true;
  EXPECT_EQ(fx.engine->ValidateAccount(candidate).id, account.id);
}

TEST_F(SessionEngineTest, BindLocationRequiresKnownIp) {
  auto login = fx.authentication->Login(fx.Ctx("1.2.3.4"), "user@example.com", warden_test::kPassword);
  EXPECT_EQ(ThrownKind([&] { fx.engine->BindLocation(login.session, "1.2.3.4"); }), std::nullopt);
  EXPECT_EQ(ThrownKind([&] { fx.engine->BindLocation(login.session, "9.9.9.9"); }), ErrorKind::kUnknownLocation);
}

TEST_F(SessionEngineTest, RevokeAllInvalidatesOnlyAuthenticationSessions) {
  fx.authentication->Login(fx.Ctx(), "user@example.com", warden_test::kPassword);
  fx.authentication->Login(fx.Ctx(), "user@example.com", warden_test::kPassword);
  auto verification = IssueVerification();

  EXPECT_EQ(fx.engine->RevokeAllAuthentication(account.id), 2u);
  EXPECT_EQ(fx.engine->RevokeAllAuthentication(account.id), 0u);
  EXPECT_TRUE(fx.repository->FindSession(verification.session.id)->valid);
}
