#include <gtest/gtest.h>

#include "flow_fixture.hpp"

using warden::ErrorKind;
using warden::WildcardMatches;
using warden_test::kPassword;
using warden_test::ThrownKind;

TEST(WildcardTest, ExactSegmentsMatch) {
  EXPECT_TRUE(WildcardMatches("account:read", "account:read"));
  EXPECT_FALSE(WildcardMatches("account:read", "account:write"));
  EXPECT_FALSE(WildcardMatches("account:read", "account"));
  EXPECT_FALSE(WildcardMatches("account", "account:read"));
}

TEST(WildcardTest, StarMatchesOneSegment) {
  EXPECT_TRUE(WildcardMatches("*:read", "account:read"));
  EXPECT_TRUE(WildcardMatches("account:*:self", "account:update:self"));
  EXPECT_FALSE(WildcardMatches("account:*:self", "account:update:other"));
}

TEST(WildcardTest, TrailingStarMatchesRemainder) {
  EXPECT_TRUE(WildcardMatches("*:*", "account:read"));
  EXPECT_TRUE(WildcardMatches("account:*", "account:read:self"));
  EXPECT_FALSE(WildcardMatches("account:*", "account"));
  EXPECT_FALSE(WildcardMatches("", "account:read"));
}

TEST(WildcardTest, AllStarGrantCoversAnySegmentCount) {
  EXPECT_TRUE(WildcardMatches("*:*", "admin"));
  EXPECT_TRUE(WildcardMatches("*:*", "account:read:self"));
  EXPECT_TRUE(WildcardMatches("*", "admin"));
  EXPECT_FALSE(WildcardMatches("*:*", ""));
}

class AuthorizationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    account = fx.RegisterVerified();
    token = fx.authentication->Login(fx.Ctx(), "user@example.com", kPassword).token;
  }

  warden_test::FlowFixture fx;
  warden::Account account;
  std::string token;
};

TEST_F(AuthorizationTest, AnyListedRolePasses) {
  auto role = fx.repository->CreateRole("Moderator", "", "post:delete");
  fx.repository->AssignRole(account.id, role.id);
  auto authorized = fx.authorization->RequireRoles(fx.Ctx(), token, {"Admin", "Moderator"});
  EXPECT_EQ(authorized.account.id, account.id);
}

TEST_F(AuthorizationTest, MissingRoleIsForbidden) {
  EXPECT_EQ(warden_test::ThrownStatus([&] { fx.authorization->RequireRoles(fx.Ctx(), token, {"Admin"}); }), 403);
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequireRoles(fx.Ctx(), token, {"Admin"}); }),
            ErrorKind::kInsufficientRole);
}

TEST_F(AuthorizationTest, DirectPermissionGrantsAccess) {
  fx.repository->AssignPermission(account.id, "report:*");
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequirePermissions(fx.Ctx(), token, {"report:export:csv"}); }),
            std::nullopt);
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequirePermissions(fx.Ctx(), token, {"billing:read"}); }),
            ErrorKind::kInsufficientPermission);
}

TEST_F(AuthorizationTest, RolePermissionsAreCommaSeparated) {
  auto role = fx.repository->CreateRole("Support", "", "ticket:read, ticket:reply");
  fx.repository->AssignRole(account.id, role.id);
  auto granted = fx.authorization->GrantedPermissions(account.id);
  ASSERT_EQ(granted.size(), 2u);
  EXPECT_EQ(granted[1], "ticket:reply");
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequirePermissions(fx.Ctx(), token, {"ticket:reply"}); }),
            std::nullopt);
}

TEST_F(AuthorizationTest, AuthenticationRunsBeforeAuthorization) {
  fx.repository->AssignPermission(account.id, "*:*");
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequirePermissions(fx.Ctx("9.9.9.9"), token, {"a:b"}); }),
            ErrorKind::kUnknownLocation);
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequirePermissions(fx.Ctx(), "garbage", {"a:b"}); }),
            ErrorKind::kDecode);
}

TEST_F(AuthorizationTest, HeadAdminHoldsEveryPermission) {
  auto admin = fx.authentication->GenerateInitialAdmin("admin@example.com", kPassword);
  auto admin_token = fx.authentication->Login(fx.Ctx(), "admin@example.com", kPassword).token;
  auto authorized = fx.authorization->RequirePermissions(fx.Ctx(), admin_token, {"anything:at_all"});
  EXPECT_EQ(authorized.account.id, admin.id);
  EXPECT_EQ(ThrownKind([&] { fx.authorization->RequireRoles(fx.Ctx(), admin_token, {warden::kHeadAdminName}); }),
            std::nullopt);
}
