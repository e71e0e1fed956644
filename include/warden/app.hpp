/*
 * 설명: 서버 전체 수명주기와 서비스 조립(컴포지션 루트)을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/auth_flow_test.cpp, tests/e2e/verification_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "warden/config.hpp"
#include "warden/http_session.hpp"
#include "warden/repository.hpp"

namespace warden {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Repository> GetRepository() { return repository_; }
  std::shared_ptr<SessionEngine> GetSessionEngine() { return services_->engine; }
  std::shared_ptr<AuthenticationService> GetAuthentication() { return services_->authentication; }
  std::shared_ptr<Observability> GetObservability() { return services_->observability; }

 private:
  void RunWorkers();
  void LoadProxyDatabase();
  void ScheduleProxyReload();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::thread_pool request_pool_;
  boost::asio::steady_timer proxy_timer_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Repository> repository_;
  std::shared_ptr<ServiceContext> services_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace warden
