#include "walltint/color/semantic_palette.hpp"

#include "walltint/color/color_math.hpp"

namespace walltint::color
{

  namespace
  {
    SemanticPalette makeDefault(Mode mode)
    {
      SemanticPalette p{};
#define X(name, darkValue, lightValue) p.name = (mode == Mode::Dark) ? darkValue : lightValue;
      WALLTINT_PALETTE_ROLES(X)
#undef X
      return p;
    }
  } // namespace

  std::optional<RoleId> roleFromName(std::string_view name) noexcept
  {
    for (std::size_t i = 0; i < kRoleCount; ++i)
    {
      if (kRoleNames[i] == name)
        return static_cast<RoleId>(i);
    }
    return std::nullopt;
  }

  bool operator==(const SemanticPalette &a, const SemanticPalette &b) noexcept
  {
#define X(name, darkValue, lightValue) \
  if (a.name != b.name)                \
    return false;
    WALLTINT_PALETTE_ROLES(X)
#undef X
    return true;
  }

  const SemanticPalette &defaultPalette(Mode mode) noexcept
  {
    static const SemanticPalette dark = makeDefault(Mode::Dark);
    static const SemanticPalette light = makeDefault(Mode::Light);
    return mode == Mode::Dark ? dark : light;
  }

  bool meetsModeLuminance(sf::Color background, Mode mode) noexcept
  {
    const double y = relativeLuminance(background);
    return mode == Mode::Dark ? (y < kDarkBackgroundMaxLuminance) : (y > kLightBackgroundMinLuminance);
  }

  bool isReadable(const SemanticPalette &p, Mode mode) noexcept
  {
    if (!meetsModeLuminance(p.background, mode))
      return false;
    for (const TextPair &pair : kTextPairs)
    {
      if (contrastRatio(role(p, pair.text), role(p, pair.on)) < kMinTextContrast)
        return false;
    }
    return true;
  }

} // namespace walltint::color
