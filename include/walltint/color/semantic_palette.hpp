#pragma once

#include <SFML/Graphics/Color.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "walltint/theme_types.hpp"

namespace walltint::color
{

// Every palette role with its built-in dark and light fallback values.
//
// - The order defines RoleId and the order roles are written to palette files.
// - Fallback values satisfy the same contrast and mode-luminance rules as synthesized palettes.
#define WALLTINT_PALETTE_ROLES(X)                                                          \
  X(background, sf::Color(20, 22, 25), sf::Color(248, 249, 250))     /* #141619 #F8F9FA */ \
  X(surface, sf::Color(31, 34, 39), sf::Color(232, 234, 237))        /* #1F2227 #E8EAED */ \
  X(primary, sf::Color(138, 180, 248), sf::Color(26, 86, 196))       /* #8AB4F8 #1A56C4 */ \
  X(accent, sf::Color(242, 139, 130), sf::Color(179, 38, 30))        /* #F28B82 #B3261E */ \
  X(neutral, sf::Color(95, 99, 104), sf::Color(128, 134, 139))       /* #5F6368 #80868B */ \
  X(on_background, sf::Color(250, 250, 250), sf::Color(18, 18, 18))                        \
  X(on_surface, sf::Color(250, 250, 250), sf::Color(18, 18, 18))                           \
  X(on_primary, sf::Color(18, 18, 18), sf::Color(250, 250, 250))                           \
  X(on_accent, sf::Color(18, 18, 18), sf::Color(250, 250, 250))

  struct SemanticPalette
  {
#define X(name, darkValue, lightValue) sf::Color name;
    WALLTINT_PALETTE_ROLES(X)
#undef X
  };

  enum class RoleId : std::uint8_t
  {
#define X(name, darkValue, lightValue) name,
    WALLTINT_PALETTE_ROLES(X)
#undef X
        Count
  };

  [[nodiscard]] constexpr std::size_t toIndex(RoleId id) noexcept
  {
    return static_cast<std::size_t>(id);
  }

  inline constexpr std::size_t kRoleCount = toIndex(RoleId::Count);

  // Role names as they appear in palette files.
  inline constexpr std::array<std::string_view, kRoleCount> kRoleNames{
#define X(name, darkValue, lightValue) std::string_view{#name},
      WALLTINT_PALETTE_ROLES(X)
#undef X
  };

  static_assert(std::is_standard_layout_v<SemanticPalette>,
                "SemanticPalette must be standard-layout for offset-based indexed access.");

  inline constexpr std::array<std::size_t, kRoleCount> kRoleOffsets{
#define X(name, darkValue, lightValue) offsetof(SemanticPalette, name),
      WALLTINT_PALETTE_ROLES(X)
#undef X
  };

  [[nodiscard]] inline sf::Color &role(SemanticPalette &p, RoleId id) noexcept
  {
    auto *base = reinterpret_cast<unsigned char *>(&p);
    return *reinterpret_cast<sf::Color *>(base + kRoleOffsets[toIndex(id)]);
  }

  [[nodiscard]] inline const sf::Color &role(const SemanticPalette &p, RoleId id) noexcept
  {
    const auto *base = reinterpret_cast<const unsigned char *>(&p);
    return *reinterpret_cast<const sf::Color *>(base + kRoleOffsets[toIndex(id)]);
  }

  [[nodiscard]] std::optional<RoleId> roleFromName(std::string_view name) noexcept;

  // Text role and the role it is drawn on.
  struct TextPair
  {
    RoleId text;
    RoleId on;
  };

  inline constexpr std::array<TextPair, 4> kTextPairs{{
      {RoleId::on_background, RoleId::background},
      {RoleId::on_surface, RoleId::surface},
      {RoleId::on_primary, RoleId::primary},
      {RoleId::on_accent, RoleId::accent},
  }};

  // Readability bar for every text pair (WCAG AA, normal text).
  inline constexpr double kMinTextContrast = 4.5;
  // Non-text UI contrast of primary/accent against the background.
  inline constexpr double kMinAccentContrast = 3.0;
  // Relative luminance bands the background must fall in.
  inline constexpr double kDarkBackgroundMaxLuminance = 0.03;
  inline constexpr double kLightBackgroundMinLuminance = 0.75;

  [[nodiscard]] bool operator==(const SemanticPalette &a, const SemanticPalette &b) noexcept;
  [[nodiscard]] inline bool operator!=(const SemanticPalette &a, const SemanticPalette &b) noexcept
  {
    return !(a == b);
  }

  [[nodiscard]] const SemanticPalette &defaultPalette(Mode mode) noexcept;

  [[nodiscard]] bool meetsModeLuminance(sf::Color background, Mode mode) noexcept;

  // True when every text pair reaches kMinTextContrast and the background fits the mode.
  [[nodiscard]] bool isReadable(const SemanticPalette &p, Mode mode) noexcept;

} // namespace walltint::color
