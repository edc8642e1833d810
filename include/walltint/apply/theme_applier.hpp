#pragma once

#include <string>

#include "walltint/color/semantic_palette.hpp"
#include "walltint/theme_types.hpp"

namespace walltint::apply
{

  // Desktop-side sink for finished palettes. Delivery is best-effort: a false return is logged by
  // the caller and retried only on the next change.
  class ThemeApplier
  {
  public:
    virtual ~ThemeApplier() = default;

    virtual bool apply(const std::string &outputId, Mode mode, const color::SemanticPalette &palette,
                       std::string *outError = nullptr) = 0;
  };

} // namespace walltint::apply
