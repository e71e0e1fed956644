#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "warden/observability.hpp"

TEST(ObservabilityTest, EventIsSingleJsonLine) {
  std::ostringstream out;
  warden::Observability obs(warden::LogLevel::kInfo, &out);
  obs.Event(warden::LogLevel::kWarn, "auth.unknown_location", {{"ip", "9.9.9.9"}});

  std::string line = out.str();
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  auto parsed = nlohmann::json::parse(line);
  EXPECT_EQ(parsed["level"], "warn");
  EXPECT_EQ(parsed["eventName"], "auth.unknown_location");
  EXPECT_EQ(parsed["fields"]["ip"], "9.9.9.9");
}

TEST(ObservabilityTest, EventsBelowLevelAreDropped) {
  std::ostringstream out;
  warden::Observability obs(warden::LogLevel::kWarn, &out);
  obs.Event(warden::LogLevel::kInfo, "auth.login");
  obs.Event(warden::LogLevel::kDebug, "delivery.email");
  EXPECT_TRUE(out.str().empty());
  obs.Event(warden::LogLevel::kError, "server.failed");
  EXPECT_NE(out.str().find("server.failed"), std::string::npos);
}

TEST(ObservabilityTest, RequestLogCarriesContext) {
  std::ostringstream out;
  warden::Observability obs(warden::LogLevel::kInfo, &out);
  warden::LogContext ctx;
  ctx.trace_id = "t-1";
  ctx.name = "POST /api/auth/login";
  ctx.status = 200;
  ctx.account_id = 7;
  ctx.latency_ms = 3;
  obs.Log(ctx);

  auto parsed = nlohmann::json::parse(out.str());
  EXPECT_EQ(parsed["traceId"], "t-1");
  EXPECT_EQ(parsed["status"], 200);
  EXPECT_EQ(parsed["accountId"], 7);
  EXPECT_FALSE(parsed.contains("sessionId"));
}

TEST(ObservabilityTest, CountersAccumulate) {
  std::ostringstream out;
  warden::Observability obs(warden::LogLevel::kInfo, &out);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.IncrementLogin();
  obs.IncrementRejectedAuthentication();
  auto snapshot = obs.Snapshot();
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.logins, 1u);
  EXPECT_EQ(snapshot.rejected_authentications, 1u);
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  warden::Observability obs;
  EXPECT_NE(obs.NextTraceId(), obs.NextTraceId());
}

TEST(ObservabilityTest, ParseLogLevelDefaultsToInfo) {
  EXPECT_EQ(warden::ParseLogLevel("debug"), warden::LogLevel::kDebug);
  EXPECT_EQ(warden::ParseLogLevel("warning"), warden::LogLevel::kWarn);
  EXPECT_EQ(warden::ParseLogLevel("verbose"), warden::LogLevel::kInfo);
}
