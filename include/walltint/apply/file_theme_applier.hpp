#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "walltint/apply/theme_applier.hpp"

namespace walltint::apply
{

  // Writes the active palette of each output to <dir>/<output>.palette and, when configured,
  // runs `hook <output> <dark|light> <file>` so a desktop-specific script can pick it up.
  class FileThemeApplier final : public ThemeApplier
  {
  public:
    explicit FileThemeApplier(std::filesystem::path directory,
                              std::optional<std::string> hookPath = std::nullopt);

    bool apply(const std::string &outputId, Mode mode, const color::SemanticPalette &palette,
               std::string *outError = nullptr) override;

    std::filesystem::path pathFor(const std::string &outputId) const;

  private:
    std::filesystem::path m_dir;
    std::optional<std::string> m_hook;
    std::mutex m_writeMtx;
  };

} // namespace walltint::apply
