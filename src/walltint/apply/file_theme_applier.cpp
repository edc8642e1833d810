#include "walltint/apply/file_theme_applier.hpp"

#include <fstream>

#include "walltint/apply/platform_spawn.hpp"
#include "walltint/cache/palette_io.hpp"
#include "walltint/cache/wallpaper_identity.hpp"
#include "walltint/log.hpp"

namespace walltint::apply
{
  namespace fs = std::filesystem;

  FileThemeApplier::FileThemeApplier(fs::path directory, std::optional<std::string> hookPath)
      : m_dir(std::move(directory)), m_hook(std::move(hookPath))
  {
  }

  fs::path FileThemeApplier::pathFor(const std::string &outputId) const
  {
    return m_dir / (cache::sanitize(outputId) + ".palette");
  }

  bool FileThemeApplier::apply(const std::string &outputId, Mode mode, const color::SemanticPalette &palette,
                               std::string *outError)
  {
    const fs::path target = pathFor(outputId);
    {
      std::lock_guard<std::mutex> lk(m_writeMtx);

      std::error_code ec;
      fs::create_directories(m_dir, ec);
      if (ec)
      {
        if (outError)
          *outError = "cannot create " + m_dir.string() + ": " + ec.message();
        return false;
      }

      const fs::path tmp = target.string() + ".tmp";
      {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out)
        {
          if (outError)
            *outError = "cannot open " + tmp.string();
          return false;
        }
        out << "# output " << outputId << "\n";
        cache::writePalette(out, mode, palette);
        out.flush();
        if (!out)
        {
          if (outError)
            *outError = "write error on " + tmp.string();
          return false;
        }
      }
      fs::rename(tmp, target, ec);
      if (ec)
      {
        if (outError)
          *outError = "cannot replace " + target.string() + ": " + ec.message();
        return false;
      }
    }

    log::info("ThemeApplier", outputId, " <- ", toString(mode), " palette (background ",
              cache::formatColor(palette.background), ", primary ", cache::formatColor(palette.primary), ")");

    if (!m_hook)
      return true;

    std::string err;
    const ProcessResult r = runAndWait(*m_hook, {outputId, std::string(toString(mode)), target.string()}, &err);
    if (!r.started || r.exitCode != 0)
    {
      if (outError)
        *outError = err.empty() ? (*m_hook + " exited with status " + std::to_string(r.exitCode)) : err;
      return false;
    }
    return true;
  }

} // namespace walltint::apply
