#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace walltint
{
  enum class Mode : std::uint8_t
  {
    Dark = 0,
    Light = 1
  };

  constexpr inline Mode operator~(Mode m)
  {
    return m == Mode::Dark ? Mode::Light : Mode::Dark;
  }

  constexpr std::string_view toString(Mode m) noexcept
  {
    return m == Mode::Dark ? "dark" : "light";
  }

  inline std::optional<Mode> parseMode(std::string_view s)
  {
    if (s == "dark")
      return Mode::Dark;
    if (s == "light")
      return Mode::Light;
    return std::nullopt;
  }

  enum class ErrorCode : std::uint8_t
  {
    None = 0,
    DecodeFailed,  // image unreadable or unsupported
    NoViableColor, // decoded, but nothing to build a palette from
    PersistFailed, // cache write failed
    ApplyFailed    // theme sink rejected the palette
  };

  constexpr std::string_view toString(ErrorCode e) noexcept
  {
    switch (e)
    {
    case ErrorCode::None:
      return "none";
    case ErrorCode::DecodeFailed:
      return "decode-failed";
    case ErrorCode::NoViableColor:
      return "no-viable-color";
    case ErrorCode::PersistFailed:
      return "persist-failed";
    case ErrorCode::ApplyFailed:
      return "apply-failed";
    }
    return "unknown";
  }
} // namespace walltint
