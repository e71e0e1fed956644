/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/auth_flow_test.cpp
 */
#include <csignal>
#include <iostream>

#include "warden/app.hpp"

int main() {
  using namespace warden;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "설정 로드 실패: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app.Run();
  return 0;
}
