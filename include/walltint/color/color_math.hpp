#pragma once

#include <SFML/Graphics/Color.hpp>

#include <cstdint>

namespace walltint::color
{

  // CIE L*a*b* (D65). L in [0, 100].
  struct Lab
  {
    double l{0.0};
    double a{0.0};
    double b{0.0};
  };

  // Cylindrical Lab. Hue in degrees, [0, 360).
  struct Lch
  {
    double l{0.0};
    double c{0.0};
    double h{0.0};
  };

  // WCAG 2.1 relative luminance weights on linearized sRGB.
  inline constexpr double kLumaR = 0.2126;
  inline constexpr double kLumaG = 0.7152;
  inline constexpr double kLumaB = 0.0722;

  [[nodiscard]] double srgbToLinear(std::uint8_t v) noexcept;
  [[nodiscard]] std::uint8_t linearToSrgb(double v) noexcept;

  [[nodiscard]] Lab toLab(sf::Color c) noexcept;
  // Out-of-gamut results are clamped per channel.
  [[nodiscard]] sf::Color fromLab(const Lab &lab, std::uint8_t alpha = 255) noexcept;

  [[nodiscard]] Lch toLch(const Lab &lab) noexcept;
  [[nodiscard]] Lab toLab(const Lch &lch) noexcept;
  [[nodiscard]] Lch toLch(sf::Color c) noexcept;
  [[nodiscard]] sf::Color fromLch(const Lch &lch, std::uint8_t alpha = 255) noexcept;

  [[nodiscard]] double deltaE(const Lab &x, const Lab &y) noexcept;
  [[nodiscard]] double hueDistance(double h1, double h2) noexcept;
  [[nodiscard]] Lch rotateHue(Lch c, double degrees) noexcept;

  [[nodiscard]] double relativeLuminance(sf::Color c) noexcept;
  // (L1 + 0.05) / (L2 + 0.05), lighter over darker. Range [1, 21].
  [[nodiscard]] double contrastRatio(sf::Color x, sf::Color y) noexcept;

  // Searches lightness (41 steps over [0, 100]) for the value closest to the original that reaches
  // minRatio against `against`. Falls back to the highest-contrast step if none does.
  [[nodiscard]] sf::Color adjustLightnessForContrast(const Lch &original, sf::Color against,
                                                     double minRatio) noexcept;

  [[nodiscard]] inline std::uint32_t packRgb(sf::Color c) noexcept
  {
    return (static_cast<std::uint32_t>(c.r) << 16) | (static_cast<std::uint32_t>(c.g) << 8) |
           static_cast<std::uint32_t>(c.b);
  }

} // namespace walltint::color
