/*
 * 설명: 서버 및 인증 엔진 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_test.cpp, tests/e2e/auth_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace warden {

struct AppConfig {
  unsigned short port;
  std::string storage_backend;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  std::string secret;
  std::vector<std::string> trusted_proxies;
  std::size_t proxy_count;
  bool login_with_username;
  bool two_factor;
  std::size_t session_days;
  std::size_t verification_minutes;
  std::size_t captcha_minutes;
  std::size_t code_length;
  std::size_t code_pool_size;
  unsigned int pbkdf2_iterations;
  std::size_t worker_threads;
  std::string initial_admin_email;
  std::string initial_admin_password;
  std::string proxy_database_path;
  std::size_t proxy_reload_seconds;
  bool secure_cookies;
};

AppConfig DefaultConfig();
AppConfig LoadConfigFromEnv();

std::vector<std::string> SplitList(const std::string& value, char delimiter = ',');

}  // namespace warden
