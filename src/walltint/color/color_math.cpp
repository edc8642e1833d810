#include "walltint/color/color_math.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace walltint::color
{

  namespace
  {
    // D65 reference white.
    constexpr double kXn = 0.95047;
    constexpr double kYn = 1.00000;
    constexpr double kZn = 1.08883;

    constexpr double kDelta = 6.0 / 29.0;

    double labF(double t) noexcept
    {
      return (t > kDelta * kDelta * kDelta) ? std::cbrt(t) : (t / (3.0 * kDelta * kDelta) + 4.0 / 29.0);
    }

    double labFInv(double t) noexcept
    {
      return (t > kDelta) ? (t * t * t) : (3.0 * kDelta * kDelta * (t - 4.0 / 29.0));
    }

    double normalizeHue(double h) noexcept
    {
      h = std::fmod(h, 360.0);
      if (h < 0.0)
        h += 360.0;
      return h;
    }
  } // namespace

  double srgbToLinear(std::uint8_t v) noexcept
  {
    const double c = v / 255.0;
    return (c <= 0.04045) ? (c / 12.92) : std::pow((c + 0.055) / 1.055, 2.4);
  }

  std::uint8_t linearToSrgb(double v) noexcept
  {
    v = std::clamp(v, 0.0, 1.0);
    const double c = (v <= 0.0031308) ? (12.92 * v) : (1.055 * std::pow(v, 1.0 / 2.4) - 0.055);
    return static_cast<std::uint8_t>(std::lround(std::clamp(c, 0.0, 1.0) * 255.0));
  }

  Lab toLab(sf::Color c) noexcept
  {
    const double r = srgbToLinear(c.r);
    const double g = srgbToLinear(c.g);
    const double b = srgbToLinear(c.b);

    const double x = r * 0.4124564 + g * 0.3575761 + b * 0.1804375;
    const double y = r * 0.2126729 + g * 0.7151522 + b * 0.0721750;
    const double z = r * 0.0193339 + g * 0.1191920 + b * 0.9503041;

    const double fx = labF(x / kXn);
    const double fy = labF(y / kYn);
    const double fz = labF(z / kZn);

    return Lab{116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
  }

  sf::Color fromLab(const Lab &lab, std::uint8_t alpha) noexcept
  {
    const double fy = (lab.l + 16.0) / 116.0;
    const double fx = fy + lab.a / 500.0;
    const double fz = fy - lab.b / 200.0;

    const double x = kXn * labFInv(fx);
    const double y = kYn * labFInv(fy);
    const double z = kZn * labFInv(fz);

    const double r = x * 3.2404542 + y * -1.5371385 + z * -0.4985314;
    const double g = x * -0.9692660 + y * 1.8760108 + z * 0.0415560;
    const double b = x * 0.0556434 + y * -0.2040259 + z * 1.0572252;

    return sf::Color(linearToSrgb(r), linearToSrgb(g), linearToSrgb(b), alpha);
  }

  Lch toLch(const Lab &lab) noexcept
  {
    const double c = std::hypot(lab.a, lab.b);
    double h = 0.0;
    if (c > 1e-9)
      h = normalizeHue(std::atan2(lab.b, lab.a) * 180.0 / std::numbers::pi);
    return Lch{lab.l, c, h};
  }

  Lab toLab(const Lch &lch) noexcept
  {
    const double rad = lch.h * std::numbers::pi / 180.0;
    return Lab{lch.l, lch.c * std::cos(rad), lch.c * std::sin(rad)};
  }

  Lch toLch(sf::Color c) noexcept
  {
    return toLch(toLab(c));
  }

  sf::Color fromLch(const Lch &lch, std::uint8_t alpha) noexcept
  {
    Lch clamped = lch;
    clamped.l = std::clamp(clamped.l, 0.0, 100.0);
    clamped.c = std::max(0.0, clamped.c);
    return fromLab(toLab(clamped), alpha);
  }

  double deltaE(const Lab &x, const Lab &y) noexcept
  {
    const double dl = x.l - y.l;
    const double da = x.a - y.a;
    const double db = x.b - y.b;
    return std::sqrt(dl * dl + da * da + db * db);
  }

  double hueDistance(double h1, double h2) noexcept
  {
    const double d = std::fabs(normalizeHue(h1) - normalizeHue(h2));
    return std::min(d, 360.0 - d);
  }

  Lch rotateHue(Lch c, double degrees) noexcept
  {
    c.h = normalizeHue(c.h + degrees);
    return c;
  }

  double relativeLuminance(sf::Color c) noexcept
  {
    return kLumaR * srgbToLinear(c.r) + kLumaG * srgbToLinear(c.g) + kLumaB * srgbToLinear(c.b);
  }

  double contrastRatio(sf::Color x, sf::Color y) noexcept
  {
    const double lx = relativeLuminance(x);
    const double ly = relativeLuminance(y);
    const double hi = std::max(lx, ly);
    const double lo = std::min(lx, ly);
    return (hi + 0.05) / (lo + 0.05);
  }

  sf::Color adjustLightnessForContrast(const Lch &original, sf::Color against, double minRatio) noexcept
  {
    const sf::Color unchanged = fromLch(original);
    if (contrastRatio(unchanged, against) >= minRatio)
      return unchanged;

    constexpr int kSteps = 40;
    bool found = false;
    sf::Color closest = unchanged;
    double closestDist = 0.0;
    sf::Color strongest = unchanged;
    double strongestRatio = contrastRatio(unchanged, against);

    for (int i = 0; i <= kSteps; ++i)
    {
      Lch candidate = original;
      candidate.l = 100.0 * i / kSteps;
      const sf::Color c = fromLch(candidate);
      const double ratio = contrastRatio(c, against);

      if (ratio > strongestRatio)
      {
        strongestRatio = ratio;
        strongest = c;
      }
      if (ratio >= minRatio)
      {
        const double dist = std::fabs(candidate.l - original.l);
        if (!found || dist < closestDist)
        {
          found = true;
          closestDist = dist;
          closest = c;
        }
      }
    }
    return found ? closest : strongest;
  }

} // namespace walltint::color
