#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "walltint/cache/wallpaper_identity.hpp"
#include "walltint/color/semantic_palette.hpp"
#include "walltint/theme_types.hpp"

namespace walltint::cache
{

  // Persistent (wallpaper, mode) -> palette store, one human-editable file per entry:
  //
  //   <state dir>/<identity>_dark.palette
  //   <state dir>/<identity>_light.palette
  //
  // The files are the source of truth. Parsed entries are mirrored in memory and reused only
  // while the file's size and mtime are unchanged, so deleting or editing a file is seen on the
  // next get().
  class PaletteCache
  {
  public:
    explicit PaletteCache(std::filesystem::path directory);
    ~PaletteCache();

    PaletteCache(const PaletteCache &) = delete;
    PaletteCache &operator=(const PaletteCache &) = delete;

    // Creates the state directory. get/put/invalidate before open() behave as a miss / failure.
    bool open(std::string *outError = nullptr);
    void close();
    bool isOpen() const noexcept { return m_open.load(); }

    // Pure lookup. Read errors and malformed files are logged and reported as a miss.
    [[nodiscard]] std::optional<color::SemanticPalette> get(const WallpaperIdentity &id, Mode mode) const;
    [[nodiscard]] bool contains(const WallpaperIdentity &id, Mode mode) const;

    // Writes atomically (temp file + rename); overwrites. On failure *outError is PersistFailed.
    bool put(const WallpaperIdentity &id, Mode mode, const color::SemanticPalette &palette,
             ErrorCode *outError = nullptr);

    void invalidate(const WallpaperIdentity &id, Mode mode);

    const std::filesystem::path &directory() const noexcept { return m_dir; }
    std::filesystem::path pathFor(const WallpaperIdentity &id, Mode mode) const;

    static std::string fileNameFor(const WallpaperIdentity &id, Mode mode);

    struct EntryName
    {
      WallpaperIdentity identity;
      Mode mode{Mode::Dark};
    };
    // Recovers identity and mode from a cache file name alone.
    static std::optional<EntryName> parseFileName(std::string_view fileName);

  private:
    struct Mirror
    {
      color::SemanticPalette palette{};
      std::filesystem::file_time_type mtime{};
      std::uintmax_t size{0};
    };

    std::filesystem::path m_dir;
    std::atomic<bool> m_open{false};
    std::atomic<std::uint64_t> m_tmpCounter{0};

    mutable std::mutex m_mtx;
    mutable std::unordered_map<std::string, Mirror> m_mirror; // by file name
  };

} // namespace walltint::cache
