#pragma once

#include "rendering/IRenderer.hpp"

#include <optional>
#include <string>

namespace orrery {

/// Named display colours for bodies.
///
/// Accepts the CSS/matplotlib base names used by body catalogues ("yellow",
/// "grey", "orange", ...), case-insensitively, and "#rrggbb" / "#rrggbbaa".
class Palette {
public:
    static std::optional<Color> parse(const std::string& name);
};

} // namespace orrery
