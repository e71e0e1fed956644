/*
 * 설명: captcha 코드를 글자 흔들림과 잡음선이 섞인 SVG 이미지로 그린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/verification_test.cpp
 */
#pragma once

#include <cstdint>
#include <string>

namespace warden {

struct CaptchaImageOptions {
  int width{180};
  int height{60};
  int noise_lines{6};
};

std::string RenderCaptchaSvg(const std::string& code, std::uint32_t seed,
                             const CaptchaImageOptions& options = CaptchaImageOptions{});

}  // namespace warden
