/*
 * 설명: HTTP 연결을 처리하고 인증/인증 코드/복구/인가 엔드포인트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/auth_flow_test.cpp, tests/e2e/verification_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "warden/api_response.hpp"
#include "warden/authentication.hpp"
#include "warden/authorization.hpp"
#include "warden/config.hpp"
#include "warden/observability.hpp"
#include "warden/proxy_detector.hpp"
#include "warden/recovery.hpp"
#include "warden/session_engine.hpp"
#include "warden/verification.hpp"

namespace warden {

// 컴포지션 루트가 만든 서비스 묶음. 모든 연결이 공유한다.
struct ServiceContext {
  std::shared_ptr<SessionEngine> engine;
  std::shared_ptr<AuthenticationService> authentication;
  std::shared_ptr<AuthorizationService> authorization;
  std::shared_ptr<VerificationService> verification;
  std::shared_ptr<RecoveryService> recovery;
  std::shared_ptr<ProxyDetector> proxy_detector;
  std::shared_ptr<Observability> observability;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<const ServiceContext> services, boost::asio::thread_pool& workers);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Dispatch(Response& res, const std::string& path, const std::string& query);
  void SendResponse(std::shared_ptr<Response> res);

  RequestContext Context() const;
  std::string Cookie(const std::string& name) const;
  std::string AuthenticationToken() const;
  std::string RemoteIp();
  std::string ParseBearer(const std::string& header_value) const;
  void SetSessionCookie(Response& res, const IssuedSession& issued) const;

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<const ServiceContext> services_;
  boost::asio::thread_pool& workers_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::string client_ip_;
  std::optional<std::int64_t> account_id_;
  std::optional<std::string> session_id_;
};

}  // namespace warden
