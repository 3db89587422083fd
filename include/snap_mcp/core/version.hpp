#pragma once

namespace snap_mcp {

constexpr const char* kVersion = "1.0.0";

} // namespace snap_mcp
