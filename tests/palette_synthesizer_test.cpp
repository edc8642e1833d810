#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "walltint/color/color_math.hpp"
#include "walltint/color/semantic_palette.hpp"
#include "walltint/synthesis/palette_synthesizer.hpp"

using namespace walltint;
using namespace walltint::color;
using sampling::ColorSample;
using synthesis::PaletteSynthesizer;

static void checkInvariants(const SemanticPalette &p, Mode mode)
{
  for (const TextPair &pair : kTextPairs)
    assert(contrastRatio(role(p, pair.text), role(p, pair.on)) >= kMinTextContrast);

  const double bgLum = relativeLuminance(p.background);
  if (mode == Mode::Dark)
    assert(bgLum < kDarkBackgroundMaxLuminance);
  else
    assert(bgLum > kLightBackgroundMinLuminance);

  assert(contrastRatio(p.primary, p.background) >= kMinAccentContrast);
  assert(contrastRatio(p.accent, p.background) >= kMinAccentContrast);
  assert(isReadable(p, mode));
}

int main()
{
  const PaletteSynthesizer synth;

  // Built-in fallbacks satisfy everything synthesized palettes do.
  {
    checkInvariants(PaletteSynthesizer::fallback(Mode::Dark), Mode::Dark);
    checkInvariants(PaletteSynthesizer::fallback(Mode::Light), Mode::Light);
    assert(PaletteSynthesizer::fallback(Mode::Dark) != PaletteSynthesizer::fallback(Mode::Light));
  }

  // Nothing to work with.
  {
    ErrorCode err = ErrorCode::None;
    assert(!synth.synthesize({}, Mode::Dark, &err));
    assert(err == ErrorCode::NoViableColor);
    err = ErrorCode::None;
    assert(!synth.synthesize({}, Mode::Light, &err));
    assert(err == ErrorCode::NoViableColor);
  }

  // Extremes and grays.
  {
    const std::vector<std::vector<ColorSample>> cases = {
        {{sf::Color::Black, 1}},
        {{sf::Color::White, 1}},
        {{sf::Color(128, 128, 128), 5}},
        {{sf::Color(255, 0, 0), 3}, {sf::Color(0, 255, 0), 2}, {sf::Color(0, 0, 255), 1}},
        {{sf::Color(255, 255, 0), 9}, {sf::Color(255, 250, 0), 8}},
        {{sf::Color(118, 118, 118), 1}, {sf::Color(119, 119, 119), 1}},
    };
    for (const auto &samples : cases)
    {
      for (Mode mode : {Mode::Dark, Mode::Light})
      {
        ErrorCode err = ErrorCode::None;
        const auto p = synth.synthesize(samples, mode, &err);
        assert(p);
        assert(err == ErrorCode::None);
        checkInvariants(*p, mode);
      }
    }
  }

  // Pseudo-random wallpapers.
  {
    std::uint32_t s = 12345;
    auto next = [&s]
    {
      s = s * 1664525u + 1013904223u;
      return s >> 8;
    };
    for (int round = 0; round < 400; ++round)
    {
      std::vector<ColorSample> samples;
      const int n = 1 + static_cast<int>(next() % 8);
      for (int i = 0; i < n; ++i)
      {
        const std::uint32_t c = next();
        samples.push_back(ColorSample{sf::Color(c & 0xFF, (c >> 8) & 0xFF, (c >> 16) & 0xFF), 1 + next() % 500});
      }
      for (Mode mode : {Mode::Dark, Mode::Light})
      {
        const auto p = synth.synthesize(samples, mode);
        assert(p);
        checkInvariants(*p, mode);
      }
    }
  }

  // Deterministic; input order does not matter.
  {
    const std::vector<ColorSample> a = {
        {sf::Color(30, 80, 150), 40}, {sf::Color(200, 120, 40), 25}, {sf::Color(90, 140, 60), 10}};
    const std::vector<ColorSample> b = {a[2], a[0], a[1]};
    for (Mode mode : {Mode::Dark, Mode::Light})
    {
      const auto p1 = synth.synthesize(a, mode);
      const auto p2 = synth.synthesize(a, mode);
      const auto p3 = synth.synthesize(b, mode);
      assert(p1 && p2 && p3);
      assert(*p1 == *p2);
      assert(*p1 == *p3);
    }
  }

  // Primary follows the dominant hue, accent the first clearly different color.
  {
    const sf::Color teal(40, 110, 160), orange(210, 120, 40);
    const std::vector<ColorSample> samples = {
        {teal, 100}, {sf::Color(42, 112, 162), 60}, {orange, 30}};
    const double tealHue = toLch(teal).h;
    const double orangeHue = toLch(orange).h;
    for (Mode mode : {Mode::Dark, Mode::Light})
    {
      const auto p = synth.synthesize(samples, mode);
      assert(p);
      assert(hueDistance(toLch(p->primary).h, tealHue) < 20.0);
      assert(hueDistance(toLch(p->accent).h, orangeHue) < 20.0);
      // Background carries a trace of the dominant hue.
      assert(hueDistance(toLch(p->background).h, tealHue) < 45.0);
    }
  }

  // Without a distinct second color the accent is the complementary hue.
  {
    const sf::Color taupe(120, 100, 90);
    const std::vector<ColorSample> samples = {{taupe, 10}, {sf::Color(122, 101, 91), 5}};
    const auto p = synth.synthesize(samples, Mode::Dark);
    assert(p);
    assert(hueDistance(toLch(p->accent).h, toLch(taupe).h) > 90.0);
  }

  // The same wallpaper gives different dark and light palettes.
  {
    const std::vector<ColorSample> samples = {{sf::Color(60, 120, 80), 1}};
    const auto dark = synth.synthesize(samples, Mode::Dark);
    const auto light = synth.synthesize(samples, Mode::Light);
    assert(dark && light);
    assert(*dark != *light);
    assert(relativeLuminance(dark->background) < relativeLuminance(light->background));
  }

  std::cout << "palette_synthesizer_test passed\n";
  return 0;
}
