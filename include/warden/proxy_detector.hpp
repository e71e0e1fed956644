/*
 * 설명: IP2Proxy LITE CSV의 IPv4 범위를 적재해 프록시/VPN 출처를 차단한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/proxy_detector_test.cpp
 */
#pragma once

#include <cstdint>
#include <istream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace warden {

class ProxyDetector {
 public:
  ProxyDetector() = default;

  // 반환값은 적재된 범위 수. 파일을 열 수 없으면 std::runtime_error.
  std::size_t LoadFile(const std::string& path);
  std::size_t Load(std::istream& input);

  bool IsProxy(const std::string& ip) const;
  // 프록시면 errors::ProhibitedProxy()를 던진다.
  void DetectProxy(const std::string& ip) const;

  std::size_t RangeCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<std::uint32_t, std::uint32_t>> ranges_;
};

}  // namespace warden
