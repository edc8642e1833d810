#include "walltint/sampling/image_source.hpp"

#include <filesystem>

#include "walltint/log.hpp"

namespace walltint::sampling
{

  bool SfmlImageSource::load(const std::string &reference, sf::Image &out, ErrorCode *outError) const
  {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(reference, ec))
    {
      log::warn("ImageSource", "not a readable file: ", reference);
      if (outError)
        *outError = ErrorCode::DecodeFailed;
      return false;
    }

    if (!out.loadFromFile(reference))
    {
      log::warn("ImageSource", "failed to decode ", reference);
      if (outError)
        *outError = ErrorCode::DecodeFailed;
      return false;
    }

    const sf::Vector2u size = out.getSize();
    log::debug("ImageSource", "decoded ", reference, " (", size.x, "x", size.y, ")");
    return true;
  }

} // namespace walltint::sampling
