#pragma once

#include <SFML/Graphics/Image.hpp>

#include <string>

#include "walltint/theme_types.hpp"

namespace walltint::sampling
{

  // Decode boundary: turns an image reference into a pixel grid.
  class ImageSource
  {
  public:
    virtual ~ImageSource() = default;

    // Returns false and sets *outError to DecodeFailed when the reference cannot be decoded.
    virtual bool load(const std::string &reference, sf::Image &out, ErrorCode *outError = nullptr) const = 0;
  };

  // Reads image files from disk through SFML's decoders (PNG, JPEG, BMP, TGA, GIF, PSD, HDR, PIC).
  class SfmlImageSource final : public ImageSource
  {
  public:
    bool load(const std::string &reference, sf::Image &out, ErrorCode *outError = nullptr) const override;
  };

} // namespace walltint::sampling
