#include "walltint/cache/wallpaper_identity.hpp"

#include <cctype>
#include <cstdio>

namespace walltint::cache
{
  namespace fs = std::filesystem;

  namespace
  {
    // Keeps file names well below NAME_MAX once the stamp and mode suffix are appended.
    constexpr std::size_t kMaxReadableLen = 96;

    std::uint64_t mix(std::uint64_t h, std::uint64_t x) noexcept
    {
      for (int i = 0; i < 8; ++i)
      {
        h ^= (x >> (i * 8)) & 0xFFu;
        h *= 1099511628211ull;
      }
      return h;
    }
  } // namespace

  std::uint64_t fnv1a64(std::string_view data, std::uint64_t h) noexcept
  {
    for (unsigned char c : data)
    {
      h ^= c;
      h *= 1099511628211ull;
    }
    return h;
  }

  std::string sanitize(std::string_view s)
  {
    std::string out(s);
    for (char &c : out)
    {
      if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-'))
        c = '_';
    }
    return out;
  }

  WallpaperIdentity WallpaperIdentity::fromPath(const fs::path &imagePath)
  {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(imagePath, ec);
    if (ec)
      canonical = imagePath.lexically_normal();

    std::uint64_t size = 0;
    std::uint64_t stamp = 0;
    {
      std::error_code sizeEc, timeEc;
      const auto sz = fs::file_size(canonical, sizeEc);
      if (!sizeEc)
        size = static_cast<std::uint64_t>(sz);
      const auto ft = fs::last_write_time(canonical, timeEc);
      if (!timeEc)
        stamp = static_cast<std::uint64_t>(ft.time_since_epoch().count());
    }

    const std::string pathStr = canonical.string();
    std::uint64_t h = fnv1a64(pathStr);
    h = mix(h, size);
    h = mix(h, stamp);

    std::string readable = sanitize(pathStr);
    if (readable.size() > kMaxReadableLen)
      readable.erase(0, readable.size() - kMaxReadableLen);

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(h));
    return WallpaperIdentity(readable + "-" + hex);
  }

} // namespace walltint::cache
