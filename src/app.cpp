/*
 * 설명: 저장소/해시/세션 엔진/흐름 서비스를 조립하고 리스닝 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/auth_flow_test.cpp, tests/e2e/verification_flow_test.cpp
 */
#include "warden/app.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "warden/code_pool.hpp"
#include "warden/db_client.hpp"
#include "warden/delivery.hpp"
#include "warden/mariadb_repository.hpp"
#include "warden/memory_repository.hpp"
#include "warden/password_hasher.hpp"
#include "warden/session_factory.hpp"
#include "warden/token_codec.hpp"

namespace warden {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const ServiceContext> services, boost::asio::thread_pool& workers)
      : ioc_(ioc),
        acceptor_(boost::asio::make_strand(ioc)),
        config_(config),
        services_(std::move(services)),
        workers_(workers) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->services_, self->workers_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const ServiceContext> services_;
  boost::asio::thread_pool& workers_;
};

namespace {
std::shared_ptr<Repository> BuildRepository(const AppConfig& config,
                                            const std::shared_ptr<Observability>& observability) {
  if (config.storage_backend == "memory") {
    return std::make_shared<InMemoryRepository>();
  }
  if (config.storage_backend == "mariadb") {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto db_client = std::make_shared<MariaDbClient>(db_config);
    db_client->SetRetryListener([observability](std::size_t attempt, const DbException& cause) {
      observability->Event(LogLevel::kWarn, "db.retry",
                           {{"attempt", attempt}, {"code", cause.code}, {"error", std::string(cause.what())}});
    });
    return std::make_shared<MariaDbRepository>(db_client);
  }
  throw std::invalid_argument("알 수 없는 STORAGE_BACKEND: " + config.storage_backend);
}
}  // namespace

ServerApp::ServerApp(const AppConfig& config)
    : config_(config),
      ioc_(1),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      request_pool_(std::max<std::size_t>(1, config.worker_threads)),
      proxy_timer_(ioc_) {
  auto observability = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  repository_ = BuildRepository(config, observability);
  auto hasher = std::make_shared<Pbkdf2PasswordHasher>(config.pbkdf2_iterations);
  auto codec = std::make_shared<TokenCodec>(config.secret);
  auto engine = std::make_shared<SessionEngine>(repository_, codec);
  auto code_pool = std::make_shared<CodePool>(config.code_pool_size, config.code_length);

  SessionPolicy policy;
  policy.authentication_expiry = std::chrono::hours(24 * config.session_days);
  policy.verification_expiry = std::chrono::minutes(config.verification_minutes);
  policy.captcha_expiry = std::chrono::minutes(config.captcha_minutes);
  auto factory = std::make_shared<SessionFactory>(engine, code_pool, policy);

  services_ = std::make_shared<ServiceContext>();
  services_->engine = engine;
  services_->observability = observability;
  services_->authentication = std::make_shared<AuthenticationService>(repository_, hasher, engine, factory,
                                                                      observability, config.login_with_username);
  services_->authorization = std::make_shared<AuthorizationService>(repository_, services_->authentication);
  services_->verification = std::make_shared<VerificationService>(
      repository_, engine, factory, std::make_shared<LoggingDelivery>(observability), observability);
  services_->recovery =
      std::make_shared<RecoveryService>(repository_, hasher, engine, services_->verification, observability);
  services_->proxy_detector = std::make_shared<ProxyDetector>();

  if (!config.initial_admin_email.empty() && !config.initial_admin_password.empty()) {
    services_->authentication->GenerateInitialAdmin(config.initial_admin_email, config.initial_admin_password);
  }
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    if (!config_.proxy_database_path.empty()) {
      LoadProxyDatabase();
      ScheduleProxyReload();
    }
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, services_, request_pool_);
    listener_->Run();
    services_->observability->Event(LogLevel::kInfo, "server.started", {{"port", config_.port}});
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    services_->observability->Event(LogLevel::kError, "server.failed", {{"message", ex.what()}});
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::LoadProxyDatabase() {
  try {
    auto ranges = services_->proxy_detector->LoadFile(config_.proxy_database_path);
    services_->observability->Event(LogLevel::kInfo, "proxy.database_loaded", {{"ranges", ranges}});
  } catch (const std::exception& ex) {
    // 이전에 적재한 범위는 그대로 유지된다.
    services_->observability->Event(LogLevel::kError, "proxy.database_load_failed", {{"message", ex.what()}});
  }
}

void ServerApp::ScheduleProxyReload() {
  proxy_timer_.expires_after(std::chrono::seconds(config_.proxy_reload_seconds));
  proxy_timer_.async_wait([this](boost::beast::error_code ec) {
    if (ec || !running_) {
      return;
    }
    LoadProxyDatabase();
    ScheduleProxyReload();
  });
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  request_pool_.join();
}

}  // namespace warden
