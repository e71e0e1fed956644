/*
 * 설명: 외부 전송 대신 구조화 로그로 코드 전달을 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/verification_test.cpp
 */
#include "warden/delivery.hpp"

namespace warden {

LoggingDelivery::LoggingDelivery(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

void LoggingDelivery::SendEmail(const std::string& address, const std::string& subject, const std::string& body) {
  observability_->Event(LogLevel::kDebug, "delivery.email",
                        {{"to", address}, {"subject", subject}, {"body", body}});
}

void LoggingDelivery::SendSms(const std::string& phone, const std::string& body) {
  observability_->Event(LogLevel::kDebug, "delivery.sms", {{"to", phone}, {"body", body}});
}

}  // namespace warden
