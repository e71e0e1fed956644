/*
 * 설명: 정렬된 범위 목록에 대한 이진 탐색으로 프록시 여부를 판단한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/proxy_detector_test.cpp
 */
#include "warden/proxy_detector.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <boost/asio/ip/address.hpp>

#include "warden/errors.hpp"

namespace warden {

namespace {
bool ParseColumn(std::istringstream& line, std::uint32_t& out) {
  std::string field;
  if (!std::getline(line, field, ',')) {
    return false;
  }
  field.erase(std::remove(field.begin(), field.end(), '"'), field.end());
  try {
    std::size_t consumed = 0;
    unsigned long long value = std::stoull(field, &consumed);
    if (consumed != field.size() || value > 0xFFFFFFFFull) {
      return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}
}  // namespace

std::size_t ProxyDetector::LoadFile(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    throw std::runtime_error("프록시 데이터베이스를 열 수 없습니다: " + path);
  }
  return Load(input);
}

std::size_t ProxyDetector::Load(std::istream& input) {
  std::vector<std::pair<std::uint32_t, std::uint32_t>> ranges;
  std::string raw;
  while (std::getline(input, raw)) {
    std::istringstream line(raw);
    std::uint32_t from = 0;
    std::uint32_t to = 0;
    // 헤더나 깨진 줄은 건너뛴다.
    if (!ParseColumn(line, from) || !ParseColumn(line, to) || from > to) {
      continue;
    }
    ranges.emplace_back(from, to);
  }
  std::sort(ranges.begin(), ranges.end());
  std::lock_guard<std::mutex> lock(mutex_);
  ranges_ = std::move(ranges);
  return ranges_.size();
}

bool ProxyDetector::IsProxy(const std::string& ip) const {
  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address(ip, ec);
  if (ec || !address.is_v4()) {
    return false;
  }
  std::uint32_t value = address.to_v4().to_uint();
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::upper_bound(ranges_.begin(), ranges_.end(), std::make_pair(value, UINT32_MAX));
  if (it == ranges_.begin()) {
    return false;
  }
  --it;
  return value >= it->first && value <= it->second;
}

void ProxyDetector::DetectProxy(const std::string& ip) const {
  if (IsProxy(ip)) {
    throw errors::ProhibitedProxy();
  }
}

std::size_t ProxyDetector::RangeCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ranges_.size();
}

}  // namespace warden
