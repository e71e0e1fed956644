/*
 * 설명: JSON 한 줄 로그를 출력하고 요청/인증 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/observability_test.cpp
 */
#include "warden/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace warden {

namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& name) {
  if (name == "debug") {
    return LogLevel::kDebug;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::kWarn;
  }
  if (name == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel level, std::ostream* out) : level_(level), out_(out ? out : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementLogin() { logins_.fetch_add(1); }

void Observability::IncrementRejectedAuthentication() { rejected_authentications_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.logins = logins_.load();
  snapshot.rejected_authentications = rejected_authentications_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (level_ > LogLevel::kInfo) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(LogLevel::kInfo);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.status) {
    log_json["status"] = *ctx.status;
  }
  if (ctx.account_id) {
    log_json["accountId"] = *ctx.account_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  Write(log_json);
}

void Observability::Event(LogLevel level, const std::string& name, const nlohmann::json& fields) const {
  if (level < level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = LevelName(level);
  log_json["eventName"] = name;
  if (!fields.empty()) {
    log_json["fields"] = fields;
  }
  Write(log_json);
}

void Observability::Write(const nlohmann::json& line) const {
  std::lock_guard<std::mutex> lock(write_mutex_);
  *out_ << line.dump() << std::endl;
}

}  // namespace warden
