#include <snap_mcp/core/terminal.hpp>

#include <cstdlib>

#include <unistd.h>

namespace snap_mcp {

bool IsStderrTty() {
    return isatty(STDERR_FILENO) != 0;
}

bool NoColorEnvSet() {
    const char* val = std::getenv("NO_COLOR");
    return val != nullptr;
}

bool ResolveLogColor(bool force_color, bool force_no_color) {
    if (force_no_color) return false;
    if (force_color) return true;
    if (NoColorEnvSet()) return false;
    return IsStderrTty();
}

} // namespace snap_mcp
