#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "walltint/cache/palette_cache.hpp"
#include "walltint/cache/palette_io.hpp"
#include "walltint/cache/wallpaper_identity.hpp"
#include "walltint/color/semantic_palette.hpp"

using namespace walltint;
using namespace walltint::cache;
namespace fs = std::filesystem;

static void writeFile(const fs::path &p, const std::string &text)
{
  std::ofstream out(p, std::ios::trunc);
  out << text;
}

static std::string readFile(const fs::path &p)
{
  std::ifstream in(p);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

int main()
{
  const fs::path root = fs::temp_directory_path() / ("walltint_cache_" + std::to_string(::getpid()));
  fs::remove_all(root);
  const fs::path dir = root / "state" / "palettes";

  color::SemanticPalette custom = color::defaultPalette(Mode::Dark);
  custom.primary = sf::Color(0x12, 0x34, 0x56);
  custom.accent = sf::Color(0xAB, 0xCD, 0xEF, 0x80);

  // Color text form.
  {
    assert(formatColor(sf::Color(0x14, 0x16, 0x19)) == "#141619");
    assert(formatColor(sf::Color(1, 2, 3, 4)) == "#01020304");
    assert(parseColor("#abcdef") == sf::Color(0xAB, 0xCD, 0xEF));
    assert(parseColor("  #ABCDEF80 ") == sf::Color(0xAB, 0xCD, 0xEF, 0x80));
    assert(!parseColor("abcdef"));
    assert(!parseColor("#abcde"));
    assert(!parseColor("#abcdeg"));
  }

  // Palette text: comments, sections and unknown keys are tolerated; roles are required.
  {
    std::ostringstream out;
    writePalette(out, Mode::Light, custom);
    const std::string text = out.str();
    assert(text.rfind("[palette]\nmode=light\nbackground=", 0) == 0);

    std::istringstream in("# hand written\n\n" + text + "; trailing comment\nfuture_key=1\n");
    std::string err;
    const auto parsed = readPalette(in, &err);
    assert(parsed);
    assert(parsed->mode && *parsed->mode == Mode::Light);
    assert(parsed->palette == custom);

    std::istringstream missing("[palette]\nmode=dark\nbackground=#000000\n");
    assert(!readPalette(missing, &err));
    assert(err.find("surface") != std::string::npos);

    std::istringstream badColor("background=#zzzzzz\n");
    assert(!readPalette(badColor, &err));

    std::istringstream badMode("mode=sepia\n");
    assert(!readPalette(badMode, &err));

    std::istringstream noEquals("background #000000\n");
    assert(!readPalette(noEquals, &err));
  }

  // File names carry identity and mode, and can be read back.
  {
    const WallpaperIdentity id = WallpaperIdentity::fromKey("_home_me_forest.jpg-0123456789abcdef");
    assert(PaletteCache::fileNameFor(id, Mode::Dark) == "_home_me_forest.jpg-0123456789abcdef_dark.palette");
    assert(PaletteCache::fileNameFor(id, Mode::Light) == "_home_me_forest.jpg-0123456789abcdef_light.palette");

    const auto back = PaletteCache::parseFileName("_home_me_forest.jpg-0123456789abcdef_light.palette");
    assert(back && back->identity == id && back->mode == Mode::Light);
    assert(!PaletteCache::parseFileName("x_dusk.palette"));
    assert(!PaletteCache::parseFileName("x_dark.txt"));
    assert(!PaletteCache::parseFileName("_dark.palette"));
  }

  // Identity: stable for an unchanged file, different once it is rewritten.
  {
    fs::create_directories(root);
    const fs::path img = root / "wall paper.png";
    writeFile(img, "abc");
    const WallpaperIdentity a = WallpaperIdentity::fromPath(img);
    const WallpaperIdentity b = WallpaperIdentity::fromPath(img);
    assert(a == b);
    assert(!a.empty());
    assert(a.key().find(' ') == std::string::npos);
    assert(a.key().find('/') == std::string::npos);
    assert(a.key().find("wall_paper.png-") != std::string::npos);

    writeFile(img, "abcdef");
    assert(!(WallpaperIdentity::fromPath(img) == a));

    const WallpaperIdentity missing = WallpaperIdentity::fromPath(root / "nope.png");
    assert(missing == WallpaperIdentity::fromPath(root / "nope.png"));

    const std::string longName(300, 'x');
    assert(WallpaperIdentity::fromPath(root / longName).key().size() < 200);
  }

  const WallpaperIdentity id = WallpaperIdentity::fromKey("forest-00000000000000aa");
  const WallpaperIdentity other = WallpaperIdentity::fromKey("desert-00000000000000bb");

  // Closed cache: misses and refused writes.
  {
    PaletteCache closed(dir);
    assert(!closed.isOpen());
    assert(!closed.get(id, Mode::Dark));
    ErrorCode err = ErrorCode::None;
    assert(!closed.put(id, Mode::Dark, custom, &err));
    assert(err == ErrorCode::PersistFailed);
  }

  {
    PaletteCache cache(dir);
    std::string openErr;
    assert(cache.open(&openErr));
    assert(cache.isOpen());
    assert(fs::is_directory(dir));

    // Never written.
    assert(!cache.get(id, Mode::Dark));
    assert(!cache.contains(id, Mode::Dark));

    // Put then get; modes are separate entries.
    ErrorCode err = ErrorCode::None;
    assert(cache.put(id, Mode::Dark, custom, &err));
    assert(err == ErrorCode::None);
    assert(cache.contains(id, Mode::Dark));
    assert(!cache.contains(id, Mode::Light));
    assert(!cache.contains(other, Mode::Dark));
    const auto hit = cache.get(id, Mode::Dark);
    assert(hit && *hit == custom);
    assert(!cache.get(id, Mode::Light));

    const fs::path file = cache.pathFor(id, Mode::Dark);
    assert(file.parent_path() == dir);
    assert(fs::is_regular_file(file));
    const std::string text = readFile(file);
    assert(text.find("mode=dark\n") != std::string::npos);
    assert(text.find("primary=#123456\n") != std::string::npos);
    assert(text.find("accent=#ABCDEF80\n") != std::string::npos);

    // No temp files left behind.
    int entries = 0;
    for (const auto &e : fs::directory_iterator(dir))
    {
      ++entries;
      assert(e.path().filename().string().front() != '.');
    }
    assert(entries == 1);

    // Overwrite.
    const color::SemanticPalette light = color::defaultPalette(Mode::Light);
    assert(cache.put(id, Mode::Dark, light));
    assert(*cache.get(id, Mode::Dark) == light);

    // Hand edit is served as written.
    {
      std::ostringstream edited;
      edited << "# tweaked by hand\n";
      writePalette(edited, Mode::Dark, custom);
      writeFile(file, edited.str());
      const auto again = cache.get(id, Mode::Dark);
      assert(again && *again == custom);
    }

    // Corrupt file: a miss, not an error.
    writeFile(file, "[palette]\nmode=dark\nbackground=#000000\n");
    assert(!cache.get(id, Mode::Dark));

    // Deleted behind the cache's back: a miss.
    assert(cache.put(id, Mode::Dark, custom));
    assert(cache.get(id, Mode::Dark));
    fs::remove(file);
    assert(!cache.get(id, Mode::Dark));

    // Invalidate removes the entry.
    assert(cache.put(id, Mode::Light, light));
    cache.invalidate(id, Mode::Light);
    assert(!cache.contains(id, Mode::Light));
    assert(!cache.get(id, Mode::Light));

    cache.close();
    assert(!cache.isOpen());
    assert(!cache.get(id, Mode::Dark));
  }

  // Entries survive a restart.
  {
    {
      PaletteCache first(dir);
      assert(first.open());
      assert(first.put(other, Mode::Light, custom));
    }
    PaletteCache second(dir);
    assert(second.open());
    const auto persisted = second.get(other, Mode::Light);
    assert(persisted && *persisted == custom);
  }

  // Unwritable directory: open fails.
  {
    const fs::path blocker = root / "blocker";
    writeFile(blocker, "x");
    PaletteCache blocked(blocker / "sub");
    std::string err;
    assert(!blocked.open(&err));
    assert(!err.empty());
  }

  fs::remove_all(root);
  std::cout << "palette_cache_test passed\n";
  return 0;
}
