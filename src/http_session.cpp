/*
 * 설명: HTTP 요청을 워커 풀에서 처리하고 인증/인증 코드/복구/인가 경로로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/e2e/auth_flow_test.cpp, tests/e2e/verification_flow_test.cpp, tests/e2e/two_factor_flow_test.cpp
 */
#include "warden/http_session.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <openssl/evp.h>

#include "warden/db_client.hpp"
#include "warden/errors.hpp"
#include "warden/ip_resolver.hpp"

namespace warden {

namespace {
namespace http = boost::beast::http;

class BadRequest : public std::runtime_error {
 public:
  explicit BadRequest(const std::string& message) : std::runtime_error(message) {}
};

void WriteJson(HttpSession::Response& res, unsigned status, const nlohmann::json& envelope) {
  res.result(status);
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = envelope.dump();
  res.content_length(res.body().size());
}

void WriteData(HttpSession::Response& res, const nlohmann::json& data, unsigned status = 200) {
  WriteJson(res, status, MakeSuccessEnvelope(data));
}

nlohmann::json ParseBody(const std::string& body) {
  if (body.empty()) {
    return nlohmann::json::object();
  }
  auto parsed = nlohmann::json::parse(body, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw BadRequest("JSON 본문이 올바르지 않습니다");
  }
  return parsed;
}

std::string RequireString(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || !body[key].is_string()) {
    throw BadRequest(std::string(key) + " 필드가 필요합니다");
  }
  return body[key].get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::json& body, const char* key) {
  if (!body.contains(key) || body[key].is_null()) {
    return std::nullopt;
  }
  if (!body[key].is_string()) {
    throw BadRequest(std::string(key) + " 필드는 문자열이어야 합니다");
  }
  auto value = body[key].get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string UrlDecode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '+') {
      decoded.push_back(' ');
    } else if (value[i] == '%' && i + 2 < value.size() && std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
               std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
      decoded.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else {
      decoded.push_back(value[i]);
    }
  }
  return decoded;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(UrlDecode(pair.substr(0, eq)), UrlDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::vector<std::string> RequireList(const std::unordered_map<std::string, std::string>& params, const char* key) {
  auto it = params.find(key);
  auto items = it == params.end() ? std::vector<std::string>{} : SplitList(it->second);
  if (items.empty()) {
    throw BadRequest(std::string(key) + " 쿼리 파라미터가 필요합니다");
  }
  return items;
}

// Authorization: Basic base64(identifier:password)
void DecodeBasicCredentials(const std::string& header, std::string& identifier, std::string& password) {
  const std::string prefix = "Basic ";
  if (header.empty()) {
    throw errors::Credentials("자격 증명이 제공되지 않았습니다");
  }
  if (header.compare(0, prefix.size(), prefix) != 0) {
    throw errors::Credentials("지원하지 않는 Authorization 헤더 형식입니다");
  }
  std::string encoded = header.substr(prefix.size());
  if (encoded.empty() || encoded.size() % 4 != 0) {
    throw errors::Credentials("Authorization 헤더가 올바르지 않습니다");
  }
  std::vector<unsigned char> buffer(encoded.size() / 4 * 3 + 1);
  int len = EVP_DecodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
  if (len < 0) {
    throw errors::Credentials("Authorization 헤더가 올바르지 않습니다");
  }
  std::size_t padding = static_cast<std::size_t>(std::count(encoded.end() - 2, encoded.end(), '='));
  std::string decoded(reinterpret_cast<const char*>(buffer.data()), static_cast<std::size_t>(len) - padding);
  auto colon = decoded.find(':');
  if (colon == std::string::npos) {
    throw errors::Credentials("Authorization 헤더가 올바르지 않습니다");
  }
  identifier = decoded.substr(0, colon);
  password = decoded.substr(colon + 1);
}

nlohmann::json AuthenticatedJson(const AuthenticatedSession& authenticated) {
  return {{"account", AccountToJson(authenticated.account)}, {"session", SessionToJson(authenticated.session)}};
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const ServiceContext> services, boost::asio::thread_pool& workers)
    : stream_(std::move(socket)), config_(config), services_(std::move(services)), workers_(workers) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read(stream_, buffer_, req_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = services_->observability->NextTraceId();
  services_->observability->IncrementRequest();
  auto xff_it = req_.find("X-Forwarded-For");
  std::string xff = xff_it == req_.end() ? std::string() : std::string(xff_it->value());
  client_ip_ = ResolveClientIp(RemoteIp(), xff, config_.trusted_proxies, config_.proxy_count);

  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "warden");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  std::string query;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
    query = target_str.substr(qpos + 1);
  }

  // 해시 계산과 저장소 호출이 I/O 스레드를 막지 않도록 워커 풀에서 처리한다.
  auto self = shared_from_this();
  boost::asio::post(workers_, [self, res, path, query]() {
    try {
      self->Dispatch(*res, path, query);
    } catch (const AuthError& ex) {
      WriteJson(*res, static_cast<unsigned>(ex.status), MakeErrorEnvelope(ex));
    } catch (const BadRequest& ex) {
      WriteJson(*res, 400, MakeErrorEnvelope("bad_request", ex.what()));
    } catch (const DbException& ex) {
      self->services_->observability->Event(LogLevel::kError, "storage.failure",
                                            {{"traceId", self->trace_id_}, {"code", ex.code}, {"message", ex.what()}});
      WriteJson(*res, 503, MakeErrorEnvelope("storage_unavailable", "저장소를 사용할 수 없습니다"));
    } catch (const std::exception& ex) {
      self->services_->observability->Event(LogLevel::kError, "request.failure",
                                            {{"traceId", self->trace_id_}, {"message", ex.what()}});
      WriteJson(*res, 500, MakeErrorEnvelope("internal_error", "내부 오류가 발생했습니다"));
    }
    boost::asio::post(self->stream_.get_executor(), [self, res]() { self->SendResponse(res); });
  });
}

void HttpSession::Dispatch(Response& res, const std::string& path, const std::string& query) {
  const auto method = req_.method();
  const auto ctx = Context();

  if (method == http::verb::get && path == "/api/health") {
    return WriteData(res, {{"status", "ok"}, {"version", "v1.0.0"}});
  }

  if (method == http::verb::get && path == "/metrics") {
    auto snapshot = services_->observability->Snapshot();
    return WriteData(res, {{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                           {"auth", {{"logins", snapshot.logins}, {"rejected", snapshot.rejected_authentications}}}});
  }

  if (!config_.proxy_database_path.empty() && services_->proxy_detector) {
    services_->proxy_detector->DetectProxy(client_ip_);
  }

  if (method == http::verb::post && path == "/api/auth/register") {
    auto body = ParseBody(req_.body());
    RegistrationForm form{RequireString(body, "email"), RequireString(body, "username"),
                          RequireString(body, "password"), OptionalString(body, "phone")};
    auto account = services_->authentication->Register(form);
    account_id_ = account.id;
    auto issued = services_->verification->RequestVerification(ctx, account);
    SetSessionCookie(res, issued);
    return WriteData(res, {{"account", AccountToJson(account)}, {"session", SessionToJson(issued.session)}}, 201);
  }

  if (method == http::verb::post && path == "/api/auth/login") {
    auto auth_it = req_.find(http::field::authorization);
    std::string identifier;
    std::string password;
    DecodeBasicCredentials(auth_it == req_.end() ? std::string() : std::string(auth_it->value()), identifier,
                           password);
    const bool two_factor = config_.two_factor;
    auto issued = services_->authentication->Login(ctx, identifier, password, two_factor);
    account_id_ = issued.session.account_id;
    session_id_ = issued.session.id;
    SetSessionCookie(res, issued);
    nlohmann::json data{{"session", SessionToJson(issued.session)}, {"token", issued.token}};
    if (two_factor) {
      auto challenge = services_->verification->RequestTwoStepVerification(
          ctx, services_->engine->ResolveAccount(issued.session));
      SetSessionCookie(res, challenge);
      data["two_step"] = SessionToJson(challenge.session);
    }
    return WriteData(res, data);
  }

  if (method == http::verb::post && path == "/api/auth/logout") {
    auto session = services_->engine->Decode(SessionKind::kAuthentication, AuthenticationToken());
    services_->engine->Validate(session);
    auto updated = services_->authentication->Logout(session);
    session_id_ = updated.id;
    return WriteData(res, {{"session", SessionToJson(updated)}});
  }

  if (method == http::verb::post && path == "/api/auth/refresh") {
    auto issued = services_->authentication->RefreshAuthentication(ctx, AuthenticationToken());
    session_id_ = issued.session.id;
    SetSessionCookie(res, issued);
    return WriteData(res, {{"session", SessionToJson(issued.session)}, {"token", issued.token}});
  }

  if (method == http::verb::post && path == "/api/auth/second-factor") {
    auto body = ParseBody(req_.body());
    auto two_step = services_->verification->RequiresTwoStepVerification(
        ctx, Cookie(std::string(CookieName(SessionKind::kTwoStep))), RequireString(body, "code"));
    auto updated = services_->authentication->OnSecondFactor(two_step, AuthenticationToken());
    session_id_ = updated.id;
    return WriteData(res, {{"session", SessionToJson(updated)}});
  }

  if (method == http::verb::get && path == "/api/auth/client") {
    auto authenticated = services_->authentication->Authenticate(ctx, AuthenticationToken());
    account_id_ = authenticated.account.id;
    session_id_ = authenticated.session.id;
    return WriteData(res, AuthenticatedJson(authenticated));
  }

  if (method == http::verb::get && path == "/api/captcha") {
    auto issued = services_->verification->RequestCaptcha(ctx);
    SetSessionCookie(res, issued);
    return WriteData(res, {{"session", SessionToJson(issued.session)}});
  }

  if (method == http::verb::get && path == "/api/captcha/image") {
    auto svg = services_->verification->CaptchaImage(Cookie(std::string(CookieName(SessionKind::kCaptcha))));
    res.result(http::status::ok);
    res.set(http::field::content_type, "image/svg+xml");
    res.body() = std::move(svg);
    res.content_length(res.body().size());
    return;
  }

  if (method == http::verb::post && path == "/api/captcha/verify") {
    auto body = ParseBody(req_.body());
    auto session = services_->verification->RequiresCaptcha(
        ctx, Cookie(std::string(CookieName(SessionKind::kCaptcha))), RequireString(body, "code"));
    return WriteData(res, {{"session", SessionToJson(session)}});
  }

  if (method == http::verb::post && path == "/api/verification/request") {
    auto issued = services_->verification->RequestVerification(
        ctx, std::nullopt, Cookie(std::string(CookieName(SessionKind::kVerification))));
    SetSessionCookie(res, issued);
    return WriteData(res, {{"session", SessionToJson(issued.session)}});
  }

  if (method == http::verb::post && path == "/api/verification/verify") {
    auto body = ParseBody(req_.body());
    auto session = services_->verification->RequiresVerification(
        ctx, Cookie(std::string(CookieName(SessionKind::kVerification))), RequireString(body, "code"));
    auto account = services_->verification->VerifyAccount(session);
    account_id_ = account.id;
    return WriteData(res, {{"account", AccountToJson(account)}, {"session", SessionToJson(session)}});
  }

  if (method == http::verb::post && path == "/api/recovery/request") {
    auto body = ParseBody(req_.body());
    auto issued = services_->recovery->AttemptAccountRecovery(ctx, RequireString(body, "email"));
    SetSessionCookie(res, issued);
    return WriteData(res, {{"session", SessionToJson(issued.session)}});
  }

  if (method == http::verb::post && path == "/api/recovery/fulfill") {
    auto body = ParseBody(req_.body());
    std::string password = RequireString(body, "password");
    ValidatePassword(password);
    auto session = services_->verification->RequiresTwoStepVerification(
        ctx, Cookie(std::string(CookieName(SessionKind::kTwoStep))), RequireString(body, "code"));
    auto revoked = services_->recovery->FulfillAccountRecoveryAttempt(session, password);
    account_id_ = session.account_id;
    return WriteData(res, {{"recovered", true}, {"revokedSessions", revoked}});
  }

  if (method == http::verb::get && path == "/api/authz/role") {
    auto roles = RequireList(ParseQueryParams(query), "roles");
    auto authenticated = services_->authorization->RequireRoles(ctx, AuthenticationToken(), roles);
    account_id_ = authenticated.account.id;
    return WriteData(res, AuthenticatedJson(authenticated));
  }

  if (method == http::verb::get && path == "/api/authz/permission") {
    auto required = RequireList(ParseQueryParams(query), "permissions");
    auto authenticated = services_->authorization->RequirePermissions(ctx, AuthenticationToken(), required);
    account_id_ = authenticated.account.id;
    return WriteData(res, AuthenticatedJson(authenticated));
  }

  WriteJson(res, 404, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    services_->observability->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  services_->observability->Log(LogContext{trace_id_, account_id_, session_id_, std::string(req_.target()),
                                           static_cast<long>(latency), static_cast<int>(res->result_int())});
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

RequestContext HttpSession::Context() const { return RequestContext{client_ip_, trace_id_}; }

std::string HttpSession::Cookie(const std::string& name) const {
  auto it = req_.find(http::field::cookie);
  if (it == req_.end()) {
    return {};
  }
  std::string header(it->value());
  std::size_t pos = 0;
  while (pos < header.size()) {
    auto end = header.find(';', pos);
    std::string pair = header.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    auto begin = pair.find_first_not_of(' ');
    auto eq = pair.find('=');
    if (begin != std::string::npos && eq != std::string::npos && pair.substr(begin, eq - begin) == name) {
      return pair.substr(eq + 1);
    }
    if (end == std::string::npos) {
      break;
    }
    pos = end + 1;
  }
  return {};
}

std::string HttpSession::AuthenticationToken() const {
  auto auth_it = req_.find(http::field::authorization);
  if (auth_it != req_.end()) {
    auto token = ParseBearer(std::string(auth_it->value()));
    if (!token.empty()) {
      return token;
    }
  }
  return Cookie(std::string(CookieName(SessionKind::kAuthentication)));
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return kUnknownIp;
  }
  return endpoint.address().to_string();
}

std::string HttpSession::ParseBearer(const std::string& header_value) const {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

void HttpSession::SetSessionCookie(Response& res, const IssuedSession& issued) const {
  auto max_age =
      std::chrono::duration_cast<std::chrono::seconds>(issued.session.expiration_date - Clock::now()).count();
  std::string cookie = std::string(CookieName(issued.session.kind)) + "=" + issued.token +
                       "; Path=/; HttpOnly; SameSite=Lax; Max-Age=" + std::to_string(std::max<long long>(0, max_age));
  if (config_.secure_cookies) {
    cookie += "; Secure";
  }
  res.insert(http::field::set_cookie, cookie);
}

}  // namespace warden
