#include "theme.hpp"

namespace theme {

static bool g_color = false;

void set_color(bool enabled) { g_color = enabled; }
bool color_enabled() { return g_color; }

} // namespace theme
