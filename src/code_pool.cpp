/*
 * 설명: 코드 풀을 일괄 충전하고 하나씩 꺼낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/code_pool_test.cpp
 */
#include "warden/code_pool.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <openssl/rand.h>

namespace warden {

namespace {
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::size_t kAlphabetSize = sizeof(kAlphabet) - 1;
// 256을 넘지 않는 kAlphabetSize의 최대 배수. 이 이상은 버려 편향을 없앤다.
constexpr unsigned int kRejectionLimit = 256 - (256 % kAlphabetSize);
}  // namespace

CodePool::CodePool(std::size_t capacity, std::size_t code_length, Generator generator)
    : capacity_(std::max<std::size_t>(1, capacity)), code_length_(code_length), generator_(std::move(generator)) {
  if (code_length_ == 0) {
    throw std::invalid_argument("코드 길이는 0일 수 없습니다");
  }
  if (!generator_) {
    generator_ = &CodePool::RandomCode;
  }
}

std::string CodePool::Pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (codes_.empty()) {
    RefillLocked();
  }
  std::string code = std::move(codes_.front());
  codes_.pop_front();
  return code;
}

std::size_t CodePool::Available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return codes_.size();
}

std::string CodePool::RandomCode(std::size_t length) {
  std::string code;
  code.reserve(length);
  std::vector<unsigned char> buffer(length * 2);
  while (code.size() < length) {
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
      throw std::runtime_error("난수 생성 실패");
    }
    for (unsigned char byte : buffer) {
      if (byte >= kRejectionLimit) {
        continue;
      }
      code.push_back(kAlphabet[byte % kAlphabetSize]);
      if (code.size() == length) {
        break;
      }
    }
  }
  return code;
}

void CodePool::RefillLocked() {
  for (std::size_t i = 0; i < capacity_; ++i) {
    codes_.push_back(generator_(code_length_));
  }
}

}  // namespace warden
