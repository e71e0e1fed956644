/*
 * 설명: 인증 코드 전달(email/SMS) 인터페이스와 로그 기반 기본 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/verification_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "warden/observability.hpp"

namespace warden {

// 전달 실패는 구현체의 책임이며 코어로 전파하지 않는다.
class Delivery {
 public:
  virtual ~Delivery() = default;

  virtual void SendEmail(const std::string& address, const std::string& subject, const std::string& body) = 0;
  virtual void SendSms(const std::string& phone, const std::string& body) = 0;
};

class LoggingDelivery : public Delivery {
 public:
  explicit LoggingDelivery(std::shared_ptr<Observability> observability);

  void SendEmail(const std::string& address, const std::string& subject, const std::string& body) override;
  void SendSms(const std::string& phone, const std::string& body) override;

 private:
  std::shared_ptr<Observability> observability_;
};

}  // namespace warden
