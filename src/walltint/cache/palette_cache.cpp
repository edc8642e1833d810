#include "walltint/cache/palette_cache.hpp"

#include <fstream>
#include <sstream>

#include <unistd.h>

#include "walltint/cache/palette_io.hpp"
#include "walltint/log.hpp"

namespace walltint::cache
{
  namespace fs = std::filesystem;

  namespace
  {
    constexpr std::string_view kExtension = ".palette";
    constexpr std::string_view kDarkSuffix = "_dark";
    constexpr std::string_view kLightSuffix = "_light";

    bool endsWith(std::string_view s, std::string_view suffix)
    {
      return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
    }
  } // namespace

  PaletteCache::PaletteCache(fs::path directory) : m_dir(std::move(directory)) {}

  PaletteCache::~PaletteCache()
  {
    close();
  }

  bool PaletteCache::open(std::string *outError)
  {
    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec || !fs::is_directory(m_dir, ec))
    {
      log::error("PaletteCache", "cannot create state directory ", m_dir.string(), ": ", ec.message());
      if (outError)
        *outError = "cannot create " + m_dir.string() + ": " + ec.message();
      return false;
    }
    m_open.store(true);
    log::info("PaletteCache", "using ", m_dir.string());
    return true;
  }

  void PaletteCache::close()
  {
    if (!m_open.exchange(false))
      return;
    std::lock_guard<std::mutex> lk(m_mtx);
    m_mirror.clear();
  }

  std::string PaletteCache::fileNameFor(const WallpaperIdentity &id, Mode mode)
  {
    std::string name = id.key();
    name += (mode == Mode::Dark) ? kDarkSuffix : kLightSuffix;
    name += kExtension;
    return name;
  }

  std::optional<PaletteCache::EntryName> PaletteCache::parseFileName(std::string_view fileName)
  {
    if (!endsWith(fileName, kExtension))
      return std::nullopt;
    fileName.remove_suffix(kExtension.size());

    Mode mode = Mode::Dark;
    if (endsWith(fileName, kDarkSuffix))
    {
      mode = Mode::Dark;
      fileName.remove_suffix(kDarkSuffix.size());
    }
    else if (endsWith(fileName, kLightSuffix))
    {
      mode = Mode::Light;
      fileName.remove_suffix(kLightSuffix.size());
    }
    else
    {
      return std::nullopt;
    }

    if (fileName.empty())
      return std::nullopt;
    return EntryName{WallpaperIdentity::fromKey(std::string(fileName)), mode};
  }

  fs::path PaletteCache::pathFor(const WallpaperIdentity &id, Mode mode) const
  {
    return m_dir / fileNameFor(id, mode);
  }

  bool PaletteCache::contains(const WallpaperIdentity &id, Mode mode) const
  {
    std::error_code ec;
    return m_open.load() && fs::is_regular_file(pathFor(id, mode), ec);
  }

  std::optional<color::SemanticPalette> PaletteCache::get(const WallpaperIdentity &id, Mode mode) const
  {
    if (!m_open.load())
    {
      log::warn("PaletteCache", "get() on a closed cache");
      return std::nullopt;
    }

    const std::string name = fileNameFor(id, mode);
    const fs::path path = m_dir / name;

    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status))
    {
      // Deleted behind our back (or never written): forget any mirrored copy.
      std::lock_guard<std::mutex> lk(m_mtx);
      m_mirror.erase(name);
      return std::nullopt;
    }

    std::error_code timeEc, sizeEc;
    const auto mtime = fs::last_write_time(path, timeEc);
    const auto size = fs::file_size(path, sizeEc);
    const bool haveStamp = !timeEc && !sizeEc;

    if (haveStamp)
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      auto it = m_mirror.find(name);
      if (it != m_mirror.end() && it->second.mtime == mtime && it->second.size == size)
        return it->second.palette;
    }

    std::ifstream in(path);
    if (!in)
    {
      log::warn("PaletteCache", "cannot read ", path.string(), ", treating as a miss");
      return std::nullopt;
    }

    std::string err;
    auto parsed = readPalette(in, &err);
    if (!parsed)
    {
      log::warn("PaletteCache", path.string(), ": ", err, ", treating as a miss");
      std::lock_guard<std::mutex> lk(m_mtx);
      m_mirror.erase(name);
      return std::nullopt;
    }
    if (parsed->mode && *parsed->mode != mode)
      log::warn("PaletteCache", path.string(), " declares mode=", toString(*parsed->mode),
                ", file name says ", toString(mode));

    if (haveStamp)
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      m_mirror[name] = Mirror{parsed->palette, mtime, size};
    }
    return parsed->palette;
  }

  bool PaletteCache::put(const WallpaperIdentity &id, Mode mode, const color::SemanticPalette &palette,
                         ErrorCode *outError)
  {
    auto fail = [&](const std::string &why)
    {
      log::warn("PaletteCache", "failed to persist ", fileNameFor(id, mode), ": ", why);
      if (outError)
        *outError = ErrorCode::PersistFailed;
      return false;
    };

    if (!m_open.load())
      return fail("cache is closed");

    std::error_code ec;
    fs::create_directories(m_dir, ec);
    if (ec)
      return fail(ec.message());

    const std::string name = fileNameFor(id, mode);
    const fs::path target = m_dir / name;

    std::ostringstream tmpName;
    tmpName << "." << name << ".tmp." << ::getpid() << "." << m_tmpCounter.fetch_add(1);
    const fs::path tmp = m_dir / tmpName.str();

    {
      std::ofstream out(tmp, std::ios::trunc);
      if (!out)
        return fail("cannot open " + tmp.string());
      out << "# generated by walltint; edit freely, delete to recompute\n";
      writePalette(out, mode, palette);
      out.flush();
      if (!out)
      {
        out.close();
        fs::remove(tmp, ec);
        return fail("write error");
      }
    }

    fs::rename(tmp, target, ec);
    if (ec)
    {
      const std::string why = ec.message();
      std::error_code rmEc;
      fs::remove(tmp, rmEc);
      return fail(why);
    }

    std::error_code timeEc, sizeEc;
    const auto mtime = fs::last_write_time(target, timeEc);
    const auto size = fs::file_size(target, sizeEc);

    std::lock_guard<std::mutex> lk(m_mtx);
    if (!timeEc && !sizeEc)
      m_mirror[name] = Mirror{palette, mtime, size};
    else
      m_mirror.erase(name);
    return true;
  }

  void PaletteCache::invalidate(const WallpaperIdentity &id, Mode mode)
  {
    const std::string name = fileNameFor(id, mode);
    {
      std::lock_guard<std::mutex> lk(m_mtx);
      m_mirror.erase(name);
    }

    std::error_code ec;
    fs::remove(m_dir / name, ec);
    if (ec)
      log::warn("PaletteCache", "cannot remove ", name, ": ", ec.message());
  }

} // namespace walltint::cache
