/*
 * 설명: 미리 생성한 일회용 코드 풀을 뮤텍스로 보호해 꺼내 준다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/code_pool_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace warden {

class CodePool {
 public:
  using Generator = std::function<std::string(std::size_t length)>;

  // generator가 비어 있으면 RAND_bytes 기반 영숫자 코드를 쓴다.
  CodePool(std::size_t capacity, std::size_t code_length, Generator generator = nullptr);

  std::string Pop();
  std::size_t Available() const;
  std::size_t code_length() const { return code_length_; }

  static std::string RandomCode(std::size_t length);

 private:
  void RefillLocked();

  std::size_t capacity_;
  std::size_t code_length_;
  Generator generator_;
  mutable std::mutex mutex_;
  std::deque<std::string> codes_;
};

}  // namespace warden
