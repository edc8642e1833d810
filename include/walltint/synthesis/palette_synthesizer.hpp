#pragma once

#include <optional>
#include <vector>

#include "walltint/color/semantic_palette.hpp"
#include "walltint/sampling/color_sampler.hpp"
#include "walltint/theme_types.hpp"

namespace walltint::synthesis
{

  struct SynthesisConfig
  {
    double minSecondaryDistance = 20.0; // Lab distance for a second, visibly different role color
    double darkBackgroundL = 10.0;
    double lightBackgroundL = 96.0;
    double darkSurfaceL = 18.0;
    double lightSurfaceL = 91.0;
    double darkBackgroundChroma = 14.0;
    double lightBackgroundChroma = 10.0;
    double darkSurfaceChroma = 18.0;
    double lightSurfaceChroma = 12.0;
    double neutralMinChroma = 10.0;
    double neutralMaxChroma = 24.0;
    double neutralHueSeparation = 30.0;
    double darkNeutralL = 45.0;
    double lightNeutralL = 55.0;
    double nudgeStep = 2.0; // L* units per readability nudge
  };

  // Turns clustered wallpaper colors into a complete, readable palette for one mode.
  //
  // The background keeps the dominant hue but its lightness is pinned to the mode's band; text
  // roles are near-black or near-white, and any role that cannot carry readable text is pushed
  // toward black or white until it can.
  class PaletteSynthesizer
  {
  public:
    explicit PaletteSynthesizer(const SynthesisConfig &cfg = {});

    // Fails with NoViableColor only for an empty sample set.
    [[nodiscard]] std::optional<color::SemanticPalette> synthesize(const std::vector<sampling::ColorSample> &samples,
                                                                   Mode mode,
                                                                   ErrorCode *outError = nullptr) const;

    // Built-in palette used when a wallpaper cannot be turned into one.
    [[nodiscard]] static const color::SemanticPalette &fallback(Mode mode) noexcept;

  private:
    SynthesisConfig m_cfg;
  };

} // namespace walltint::synthesis
