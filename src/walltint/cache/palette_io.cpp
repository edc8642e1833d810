#include "walltint/cache/palette_io.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <istream>
#include <ostream>
#include <utility>

namespace walltint::cache
{

  namespace
  {
    std::string_view trim(std::string_view s)
    {
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
      while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
      return s;
    }

    int hexValue(char c)
    {
      if (c >= '0' && c <= '9')
        return c - '0';
      if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
      if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
      return -1;
    }

    bool parseByte(std::string_view s, std::size_t at, sf::Uint8 &out)
    {
      const int hi = hexValue(s[at]);
      const int lo = hexValue(s[at + 1]);
      if (hi < 0 || lo < 0)
        return false;
      out = static_cast<sf::Uint8>(hi * 16 + lo);
      return true;
    }
  } // namespace

  std::string formatColor(sf::Color c)
  {
    char buf[10];
    if (c.a == 255)
      std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
    else
      std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X", c.r, c.g, c.b, c.a);
    return buf;
  }

  std::optional<sf::Color> parseColor(std::string_view s)
  {
    s = trim(s);
    if (s.empty() || s.front() != '#')
      return std::nullopt;
    s.remove_prefix(1);
    if (s.size() != 6 && s.size() != 8)
      return std::nullopt;

    sf::Color c;
    if (!parseByte(s, 0, c.r) || !parseByte(s, 2, c.g) || !parseByte(s, 4, c.b))
      return std::nullopt;
    c.a = 255;
    if (s.size() == 8 && !parseByte(s, 6, c.a))
      return std::nullopt;
    return c;
  }

  void writePalette(std::ostream &out, Mode mode, const color::SemanticPalette &palette)
  {
    out << "[palette]\n";
    out << "mode=" << toString(mode) << "\n";
    for (std::size_t i = 0; i < color::kRoleCount; ++i)
    {
      const auto id = static_cast<color::RoleId>(i);
      out << color::kRoleNames[i] << "=" << formatColor(color::role(palette, id)) << "\n";
    }
  }

  std::optional<ParsedPalette> readPalette(std::istream &in, std::string *outError)
  {
    auto fail = [&](std::string msg) -> std::optional<ParsedPalette>
    {
      if (outError)
        *outError = std::move(msg);
      return std::nullopt;
    };

    ParsedPalette parsed;
    std::array<bool, color::kRoleCount> seen{};

    std::string raw;
    int lineNo = 0;
    while (std::getline(in, raw))
    {
      ++lineNo;
      const std::string_view line = trim(raw);
      if (line.empty() || line.front() == '#' || line.front() == ';')
        continue;
      if (line.front() == '[')
        continue;

      const auto eq = line.find('=');
      if (eq == std::string_view::npos)
        return fail("line " + std::to_string(lineNo) + ": expected key=value");

      const std::string_view k = trim(line.substr(0, eq));
      const std::string_view v = trim(line.substr(eq + 1));

      if (k == "mode")
      {
        parsed.mode = parseMode(v);
        if (!parsed.mode)
          return fail("line " + std::to_string(lineNo) + ": unknown mode '" + std::string(v) + "'");
        continue;
      }

      const auto id = color::roleFromName(k);
      if (!id)
        continue;

      const auto c = parseColor(v);
      if (!c)
        return fail("line " + std::to_string(lineNo) + ": bad color '" + std::string(v) + "' for " + std::string(k));
      color::role(parsed.palette, *id) = *c;
      seen[color::toIndex(*id)] = true;
    }

    if (in.bad())
      return fail("read error");

    for (std::size_t i = 0; i < color::kRoleCount; ++i)
    {
      if (!seen[i])
        return fail("missing role '" + std::string(color::kRoleNames[i]) + "'");
    }
    return parsed;
  }

} // namespace walltint::cache
