/*
 * 설명: Boost.Asio 주소 파서로 클라이언트 IP 후보를 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/ip_resolver_test.cpp
 */
#include "warden/ip_resolver.hpp"

#include <algorithm>

#include <boost/asio/ip/address.hpp>

#include "warden/config.hpp"

namespace warden {

bool IsValidIp(const std::string& ip) {
  boost::system::error_code ec;
  boost::asio::ip::make_address(ip, ec);
  return !ec;
}

std::string ResolveClientIp(const std::string& remote_address, const std::string& x_forwarded_for,
                            const std::vector<std::string>& trusted_proxies, std::size_t proxy_count) {
  bool trusted = std::find(trusted_proxies.begin(), trusted_proxies.end(), remote_address) != trusted_proxies.end();
  if ((trusted || proxy_count > 0) && !x_forwarded_for.empty()) {
    auto hops = SplitList(x_forwarded_for);
    std::size_t from_right = std::max<std::size_t>(1, proxy_count);
    if (hops.size() >= from_right) {
      const auto& candidate = hops[hops.size() - from_right];
      if (IsValidIp(candidate)) {
        return candidate;
      }
    }
  }
  if (IsValidIp(remote_address)) {
    return remote_address;
  }
  return kUnknownIp;
}

}  // namespace warden
