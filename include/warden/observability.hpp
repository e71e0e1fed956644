/*
 * 설명: 구조화 로그와 인증 관련 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/observability_test.cpp, tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace warden {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& name);

struct LogContext {
  std::string trace_id;
  std::optional<std::int64_t> account_id;
  std::optional<std::string> session_id;
  std::string name;
  long latency_ms{0};
  std::optional<int> status;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t logins{0};
  std::uint64_t rejected_authentications{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo, std::ostream* out = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementLogin();
  void IncrementRejectedAuthentication();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Event(LogLevel level, const std::string& name, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  void Write(const nlohmann::json& line) const;

  LogLevel level_;
  std::ostream* out_;
  mutable std::mutex write_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> logins_{0};
  std::atomic<std::uint64_t> rejected_authentications_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace warden
