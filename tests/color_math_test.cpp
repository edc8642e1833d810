#include <cassert>
#include <cmath>
#include <iostream>

#include "walltint/color/color_math.hpp"

using namespace walltint::color;

static bool near(double a, double b, double eps)
{
  return std::fabs(a - b) <= eps;
}

int main()
{
  // sRGB transfer endpoints
  {
    assert(near(srgbToLinear(0), 0.0, 1e-12));
    assert(near(srgbToLinear(255), 1.0, 1e-12));
    assert(linearToSrgb(0.0) == 0);
    assert(linearToSrgb(1.0) == 255);
    assert(linearToSrgb(2.0) == 255);
    assert(linearToSrgb(-1.0) == 0);
    for (int v = 0; v < 256; v += 17)
      assert(linearToSrgb(srgbToLinear(static_cast<std::uint8_t>(v))) == v);
  }

  // WCAG luminance and contrast
  {
    const sf::Color black(0, 0, 0), white(255, 255, 255);
    assert(near(relativeLuminance(black), 0.0, 1e-12));
    assert(near(relativeLuminance(white), 1.0, 1e-9));
    assert(near(contrastRatio(black, white), 21.0, 1e-6));
    assert(near(contrastRatio(white, black), 21.0, 1e-6));
    assert(near(contrastRatio(sf::Color(119, 119, 119), sf::Color(119, 119, 119)), 1.0, 1e-12));
    // #777777 on white is the classic just-below-AA pair
    const double gray = contrastRatio(sf::Color(119, 119, 119), white);
    assert(gray > 4.4 && gray < 4.5);
  }

  // Lab reference values (D65)
  {
    const Lab w = toLab(sf::Color(255, 255, 255));
    assert(near(w.l, 100.0, 0.05) && near(w.a, 0.0, 0.05) && near(w.b, 0.0, 0.05));

    const Lab k = toLab(sf::Color(0, 0, 0));
    assert(near(k.l, 0.0, 1e-9));

    const Lab red = toLab(sf::Color(255, 0, 0));
    assert(near(red.l, 53.24, 0.1));
    assert(near(red.a, 80.09, 0.2));
    assert(near(red.b, 67.20, 0.2));

    const sf::Color samples[] = {sf::Color(255, 0, 0), sf::Color(18, 52, 86), sf::Color(200, 180, 20),
                                 sf::Color(250, 250, 250), sf::Color(1, 2, 3)};
    for (const sf::Color &c : samples)
    {
      const sf::Color back = fromLab(toLab(c));
      assert(back.r == c.r && back.g == c.g && back.b == c.b && back.a == 255);
      const sf::Color viaLch = fromLch(toLch(c), 7);
      assert(viaLch.r == c.r && viaLch.g == c.g && viaLch.b == c.b && viaLch.a == 7);
    }
  }

  // Achromatic colors have zero chroma and hue 0
  {
    const Lch g = toLch(sf::Color(128, 128, 128));
    assert(g.c < 0.05);
  }

  // Hue arithmetic wraps
  {
    assert(near(hueDistance(350.0, 10.0), 20.0, 1e-9));
    assert(near(hueDistance(10.0, 350.0), 20.0, 1e-9));
    assert(near(hueDistance(0.0, 180.0), 180.0, 1e-9));
    assert(near(rotateHue(Lch{50, 20, 350}, 20).h, 10.0, 1e-9));
    assert(near(rotateHue(Lch{50, 20, 10}, -20).h, 350.0, 1e-9));
    assert(near(rotateHue(Lch{50, 20, 90}, 180).h, 270.0, 1e-9));
  }

  // Out-of-range lightness is clamped
  {
    const sf::Color hi = fromLch(Lch{150, 0, 0});
    assert(hi.r == 255 && hi.g == 255 && hi.b == 255);
    const sf::Color lo = fromLch(Lch{-10, 0, 0});
    assert(lo.r == 0 && lo.g == 0 && lo.b == 0);
  }

  // Lightness search
  {
    const sf::Color darkBg(20, 22, 25);
    const Lch dim{20, 30, 250};
    const sf::Color fixed = adjustLightnessForContrast(dim, darkBg, 3.0);
    assert(contrastRatio(fixed, darkBg) >= 3.0);
    // The hue survives the search.
    assert(hueDistance(toLch(fixed).h, 250.0) < 15.0);

    // Already sufficient: unchanged.
    const Lch bright{80, 20, 120};
    const sf::Color same = adjustLightnessForContrast(bright, darkBg, 3.0);
    const sf::Color direct = fromLch(bright);
    assert(same == direct);

    // Impossible ratio: the strongest step is returned.
    const sf::Color best = adjustLightnessForContrast(Lch{50, 0, 0}, sf::Color(128, 128, 128), 30.0);
    assert(contrastRatio(best, sf::Color(128, 128, 128)) > 4.0);
  }

  // Packing orders by r, g, b
  {
    assert(packRgb(sf::Color(1, 2, 3)) == 0x010203u);
    assert(packRgb(sf::Color(0, 0, 255)) < packRgb(sf::Color(0, 1, 0)));
  }

  std::cout << "color_math_test passed\n";
  return 0;
}
