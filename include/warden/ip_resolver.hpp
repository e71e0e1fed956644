/*
 * 설명: 직접 연결 주소와 X-Forwarded-For에서 클라이언트 IP를 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/ip_resolver_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace warden {

constexpr const char* kUnknownIp = "0.0.0.0";

// 신뢰 프록시에서 온 요청이거나 proxy_count > 0일 때만 X-Forwarded-For를 본다.
std::string ResolveClientIp(const std::string& remote_address, const std::string& x_forwarded_for,
                            const std::vector<std::string>& trusted_proxies, std::size_t proxy_count);

bool IsValidIp(const std::string& ip);

}  // namespace warden
