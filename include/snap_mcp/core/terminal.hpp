#pragma once

namespace snap_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color decision for log output: explicit flag wins, then NO_COLOR, then tty.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace snap_mcp
