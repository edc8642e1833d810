#pragma once

#include <SFML/Graphics/Color.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "walltint/color/semantic_palette.hpp"
#include "walltint/theme_types.hpp"

namespace walltint::cache
{

  // "#RRGGBB", or "#RRGGBBAA" when not opaque.
  std::string formatColor(sf::Color c);
  std::optional<sf::Color> parseColor(std::string_view s);

  // Human-editable palette text:
  //
  //   [palette]
  //   mode=dark
  //   background=#141619
  //   ...
  void writePalette(std::ostream &out, Mode mode, const color::SemanticPalette &palette);

  struct ParsedPalette
  {
    color::SemanticPalette palette{};
    std::optional<Mode> mode;
  };

  // Every role must be present. Blank lines and lines starting with '#' or ';' are skipped,
  // unknown keys are ignored.
  std::optional<ParsedPalette> readPalette(std::istream &in, std::string *outError = nullptr);

} // namespace walltint::cache
