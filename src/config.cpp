/*
 * 설명: 환경 변수에서 설정을 읽고 누락된 값은 기본값으로 채운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/config_test.cpp
 */
#include "warden/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace warden {

namespace {
std::string RandomSecret() {
  unsigned char buffer[32];
  if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
    throw std::runtime_error("서명 비밀키 생성 실패");
  }
  std::ostringstream oss;
  for (unsigned char byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

bool ParseBool(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

// 부호 없는 10진수 전체가 [0, max] 범위일 때만 받는다.
std::size_t ParseNumber(const char* key, const std::string& value, std::size_t max) {
  const bool digits_only = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
  if (!digits_only || value.size() > 19) {
    throw std::invalid_argument(std::string(key) + " 값이 숫자가 아닙니다: " + value);
  }
  const unsigned long long parsed = std::stoull(value);
  if (parsed > max) {
    throw std::invalid_argument(std::string(key) + " 값이 허용 범위를 벗어났습니다: " + value);
  }
  return static_cast<std::size_t>(parsed);
}
}  // namespace

std::vector<std::string> SplitList(const std::string& value, char delimiter) {
  std::vector<std::string> items;
  std::istringstream iss(value);
  std::string item;
  while (std::getline(iss, item, delimiter)) {
    auto begin = item.find_first_not_of(" \t");
    auto end = item.find_last_not_of(" \t");
    if (begin == std::string::npos) {
      continue;
    }
    items.push_back(item.substr(begin, end - begin + 1));
  }
  return items;
}

AppConfig DefaultConfig() {
  AppConfig cfg;
  cfg.port = 8080;
  cfg.storage_backend = "memory";
  cfg.db_host = "mariadb";
  cfg.db_port = 3306;
  cfg.db_user = "app";
  cfg.db_password = "app_pass";
  cfg.db_name = "app_db";
  cfg.log_level = "info";
  cfg.secret = RandomSecret();
  cfg.proxy_count = 0;
  cfg.login_with_username = false;
  cfg.two_factor = false;
  cfg.session_days = 30;
  cfg.verification_minutes = 1;
  cfg.captcha_minutes = 1;
  cfg.code_length = 8;
  cfg.code_pool_size = 100;
  cfg.pbkdf2_iterations = 100000;
  cfg.worker_threads = 2;
  cfg.proxy_reload_seconds = 86400;
  cfg.secure_cookies = false;
  return cfg;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  };
  auto get_size = [](const char* key, std::size_t def, std::size_t max) -> std::size_t {
    const char* val = std::getenv(key);
    return val ? ParseNumber(key, val, max) : def;
  };

  AppConfig cfg = DefaultConfig();
  cfg.port = static_cast<unsigned short>(get_size("SERVER_PORT", cfg.port, 65535));
  cfg.storage_backend = get_env("STORAGE_BACKEND", cfg.storage_backend);
  cfg.db_host = get_env("DB_HOST", cfg.db_host);
  cfg.db_port = static_cast<unsigned short>(get_size("DB_PORT", cfg.db_port, 65535));
  cfg.db_user = get_env("DB_USER", cfg.db_user);
  cfg.db_password = get_env("DB_PASSWORD", cfg.db_password);
  cfg.db_name = get_env("DB_NAME", cfg.db_name);
  cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);
  cfg.secret = get_env("AUTH_SECRET", cfg.secret);
  cfg.trusted_proxies = SplitList(get_env("AUTH_TRUSTED_PROXIES", ""));
  cfg.proxy_count = get_size("AUTH_PROXY_COUNT", cfg.proxy_count, 32);
  cfg.login_with_username = ParseBool(get_env("AUTH_LOGIN_WITH_USERNAME", "false"));
  cfg.two_factor = ParseBool(get_env("AUTH_TWO_FACTOR", "false"));
  cfg.session_days = get_size("AUTH_SESSION_DAYS", cfg.session_days, 3650);
  cfg.verification_minutes = get_size("AUTH_VERIFICATION_MINUTES", cfg.verification_minutes, 1440);
  cfg.captcha_minutes = get_size("AUTH_CAPTCHA_MINUTES", cfg.captcha_minutes, 1440);
  cfg.code_length = get_size("AUTH_CODE_LENGTH", cfg.code_length, 64);
  cfg.code_pool_size = get_size("AUTH_CODE_POOL_SIZE", cfg.code_pool_size, 100000);
  cfg.pbkdf2_iterations =
      static_cast<unsigned int>(get_size("AUTH_PBKDF2_ITERATIONS", cfg.pbkdf2_iterations, 10000000));
  cfg.worker_threads = std::max<std::size_t>(1, get_size("AUTH_HASH_THREADS", cfg.worker_threads, 256));
  cfg.initial_admin_email = get_env("AUTH_INITIAL_ADMIN_EMAIL", "");
  cfg.initial_admin_password = get_env("AUTH_INITIAL_ADMIN_PASSWORD", "");
  cfg.proxy_database_path = get_env("AUTH_PROXY_DATABASE", "");
  cfg.proxy_reload_seconds = get_size("AUTH_PROXY_RELOAD_SECONDS", cfg.proxy_reload_seconds, 2592000);
  cfg.secure_cookies = ParseBool(get_env("AUTH_SECURE_COOKIES", "false"));
  if (cfg.secret.empty()) {
    throw std::invalid_argument("AUTH_SECRET은 비어 있을 수 없습니다");
  }
  return cfg;
}

}  // namespace warden
