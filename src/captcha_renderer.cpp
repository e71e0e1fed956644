/*
 * 설명: captcha SVG 생성. 같은 seed는 같은 이미지를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: tests/unit/verification_test.cpp
 */
#include "warden/captcha_renderer.hpp"

#include <random>
#include <sstream>

namespace warden {

std::string RenderCaptchaSvg(const std::string& code, std::uint32_t seed, const CaptchaImageOptions& options) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> jitter_y(-8, 8);
  std::uniform_int_distribution<int> rotate(-25, 25);
  std::uniform_int_distribution<int> x_dist(0, options.width);
  std::uniform_int_distribution<int> y_dist(0, options.height);
  std::uniform_int_distribution<int> shade(60, 160);

  std::ostringstream svg;
  svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << options.width << "\" height=\"" << options.height
      << "\" viewBox=\"0 0 " << options.width << ' ' << options.height << "\">";
  svg << "<rect width=\"100%\" height=\"100%\" fill=\"#f4f4f4\"/>";

  for (int i = 0; i < options.noise_lines; ++i) {
    svg << "<line x1=\"" << x_dist(gen) << "\" y1=\"" << y_dist(gen) << "\" x2=\"" << x_dist(gen) << "\" y2=\""
        << y_dist(gen) << "\" stroke=\"rgb(" << shade(gen) << ',' << shade(gen) << ',' << shade(gen)
        << ")\" stroke-width=\"2\"/>";
  }

  const int step = code.empty() ? 0 : options.width / static_cast<int>(code.size() + 1);
  const int baseline = options.height * 2 / 3;
  for (std::size_t i = 0; i < code.size(); ++i) {
    int x = step * static_cast<int>(i + 1);
    int y = baseline + jitter_y(gen);
    svg << "<text x=\"" << x << "\" y=\"" << y << "\" transform=\"rotate(" << rotate(gen) << ' ' << x << ' ' << y
        << ")\" font-family=\"monospace\" font-size=\"32\" font-weight=\"bold\" text-anchor=\"middle\" fill=\"rgb("
        << shade(gen) / 2 << ',' << shade(gen) / 2 << ',' << shade(gen) / 2 << ")\">" << code[i] << "</text>";
  }
  svg << "</svg>";
  return svg.str();
}

}  // namespace warden
