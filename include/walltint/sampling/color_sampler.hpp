#pragma once

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/Image.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "walltint/theme_types.hpp"

namespace walltint::sampling
{
  class ImageSource;

  struct ColorSample
  {
    sf::Color color;
    std::uint32_t weight{0}; // number of sampled pixels in the cluster
  };

  struct SamplerOptions
  {
    std::size_t maxSamples = 16384; // stride-sampling cap, independent of resolution
    int clusters = 8;               // K
    int maxIterations = 40;
    double convergence = 0.5;  // stop once no centroid moves further (delta E)
    double minSeedDistance = 1.0; // farthest-point seeding stops below this
  };

  // Reduces a decoded wallpaper to at most K weighted representative colors.
  //
  // Clustering is k-means in CIE Lab with farthest-point seeding, so the result depends only on
  // the pixels and the options.
  class ColorSampler
  {
  public:
    explicit ColorSampler(const SamplerOptions &opts = {});

    // Sorted by weight descending (ties: packed RGB ascending). Empty when the image has no
    // opaque pixels.
    [[nodiscard]] std::vector<ColorSample> sample(const sf::Image &image) const;

    // Decodes `reference` through `source` first; decode failure is reported, never an empty set.
    [[nodiscard]] std::optional<std::vector<ColorSample>> sampleFile(const ImageSource &source,
                                                                     const std::string &reference,
                                                                     ErrorCode *outError = nullptr) const;

    const SamplerOptions &options() const noexcept { return m_opts; }

  private:
    SamplerOptions m_opts;
  };

} // namespace walltint::sampling
