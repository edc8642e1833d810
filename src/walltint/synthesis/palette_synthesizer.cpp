#include "walltint/synthesis/palette_synthesizer.hpp"

#include <algorithm>

#include "walltint/color/color_math.hpp"
#include "walltint/log.hpp"

namespace walltint::synthesis
{

  namespace
  {
    using color::Lch;
    using sampling::ColorSample;

    const sf::Color kNearBlack(18, 18, 18);
    const sf::Color kNearWhite(250, 250, 250);

    // Enough steps to walk L* from any start to 0 or 100.
    constexpr int kMaxNudges = 60;

    sf::Color pickText(sf::Color bg)
    {
      return (color::contrastRatio(bg, kNearBlack) >= color::contrastRatio(bg, kNearWhite)) ? kNearBlack
                                                                                            : kNearWhite;
    }

    // Moves `lch` one step away from `text` (darker under light text, lighter under dark text).
    void nudgeAway(Lch &lch, sf::Color text, double step)
    {
      lch.l = std::clamp(text == kNearWhite ? lch.l - step : lch.l + step, 0.0, 100.0);
    }

    struct Readable
    {
      sf::Color fill;
      sf::Color text;
    };

    // Finds readable text for `start`, adjusting the fill's lightness if neither text color clears
    // the bar. `extra` is an additional constraint the fill has to meet (mode luminance).
    template <class Extra>
    Readable makeReadable(Lch lch, sf::Color start, double step, Extra extra)
    {
      sf::Color fill = start;
      for (int i = 0; i < kMaxNudges; ++i)
      {
        const sf::Color text = pickText(fill);
        if (color::contrastRatio(fill, text) >= color::kMinTextContrast && extra(fill))
          return Readable{fill, text};
        nudgeAway(lch, text, step);
        fill = color::fromLch(lch);
      }
      // Unreachable for sane steps: pure black or white reads against either text color.
      fill = (pickText(fill) == kNearWhite) ? sf::Color::Black : sf::Color::White;
      return Readable{fill, pickText(fill)};
    }

    std::vector<ColorSample> ranked(std::vector<ColorSample> samples)
    {
      std::stable_sort(samples.begin(), samples.end(), [](const ColorSample &a, const ColorSample &b)
                       {
        if (a.weight != b.weight) return a.weight > b.weight;
        return color::packRgb(a.color) < color::packRgb(b.color); });
      return samples;
    }
  } // namespace

  PaletteSynthesizer::PaletteSynthesizer(const SynthesisConfig &cfg) : m_cfg(cfg)
  {
    m_cfg.nudgeStep = std::max(0.5, m_cfg.nudgeStep);
  }

  const color::SemanticPalette &PaletteSynthesizer::fallback(Mode mode) noexcept
  {
    return color::defaultPalette(mode);
  }

  std::optional<color::SemanticPalette> PaletteSynthesizer::synthesize(const std::vector<ColorSample> &samples,
                                                                       Mode mode, ErrorCode *outError) const
  {
    if (samples.empty())
    {
      if (outError)
        *outError = ErrorCode::NoViableColor;
      return std::nullopt;
    }

    const bool dark = (mode == Mode::Dark);
    const std::vector<ColorSample> order = ranked(samples);

    const ColorSample &dominant = order.front();
    const color::Lab dominantLab = color::toLab(dominant.color);
    const Lch dominantLch = color::toLch(dominantLab);

    // Secondary: the heaviest sample that is not a near-duplicate of the dominant.
    std::optional<Lch> secondaryLch;
    std::size_t secondaryIdx = 0;
    for (std::size_t i = 1; i < order.size(); ++i)
    {
      if (color::deltaE(color::toLab(order[i].color), dominantLab) >= m_cfg.minSecondaryDistance)
      {
        secondaryLch = color::toLch(order[i].color);
        secondaryIdx = i;
        break;
      }
    }
    if (!secondaryLch)
      secondaryLch = color::rotateHue(dominantLch, 180.0);

    color::SemanticPalette p{};

    // Background: dominant hue, low chroma, lightness pinned to the mode band.
    {
      Lch bg{dark ? m_cfg.darkBackgroundL : m_cfg.lightBackgroundL,
             std::min(dominantLch.c, dark ? m_cfg.darkBackgroundChroma : m_cfg.lightBackgroundChroma),
             dominantLch.h};
      const Readable r = makeReadable(bg, color::fromLch(bg), m_cfg.nudgeStep, [mode](sf::Color c)
                                      { return color::meetsModeLuminance(c, mode); });
      p.background = r.fill;
      p.on_background = r.text;
    }

    // Surface: one step off the background, same hue.
    {
      Lch surface{dark ? m_cfg.darkSurfaceL : m_cfg.lightSurfaceL,
                  std::min(dominantLch.c, dark ? m_cfg.darkSurfaceChroma : m_cfg.lightSurfaceChroma),
                  dominantLch.h};
      const Readable r = makeReadable(surface, color::fromLch(surface), m_cfg.nudgeStep, [](sf::Color)
                                      { return true; });
      p.surface = r.fill;
      p.on_surface = r.text;
    }

    // Primary and accent keep their hue and chroma; only lightness moves.
    auto deriveRole = [&](const Lch &source, sf::Color &fill, sf::Color &text)
    {
      const sf::Color adjusted = color::adjustLightnessForContrast(source, p.background, color::kMinAccentContrast);
      Lch lch = color::toLch(adjusted);
      lch.h = source.h;
      const Readable r = makeReadable(lch, adjusted, m_cfg.nudgeStep, [](sf::Color)
                                      { return true; });
      fill = r.fill;
      text = r.text;
    };
    deriveRole(dominantLch, p.primary, p.on_primary);
    deriveRole(*secondaryLch, p.accent, p.on_accent);

    // Neutral: a chromatic leftover that is neither primary nor accent, else a tint of the dominant.
    {
      Lch neutral{0.0, std::min(dominantLch.c, m_cfg.neutralMinChroma), dominantLch.h};
      for (std::size_t i = 1; i < order.size(); ++i)
      {
        if (i == secondaryIdx)
          continue;
        const Lch cand = color::toLch(order[i].color);
        if (cand.c > m_cfg.neutralMinChroma &&
            color::hueDistance(cand.h, dominantLch.h) > m_cfg.neutralHueSeparation)
        {
          neutral = cand;
          break;
        }
      }
      neutral.l = dark ? m_cfg.darkNeutralL : m_cfg.lightNeutralL;
      neutral.c = std::min(neutral.c, m_cfg.neutralMaxChroma);
      p.neutral = color::fromLch(neutral);
    }

    log::debug("PaletteSynthesizer", toString(mode), " palette from ", order.size(),
               " samples, dominant weight ", dominant.weight);
    return p;
  }

} // namespace walltint::synthesis
