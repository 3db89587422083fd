#include <catch2/catch_test_macros.hpp>

#include <snap_mcp/core/terminal.hpp>

#include <cstdlib>

using namespace snap_mcp;

// ===========================================================================
// ResolveLogColor
// ===========================================================================

TEST_CASE("ResolveLogColor: --no-color wins over --color", "[core][terminal]") {
    CHECK_FALSE(ResolveLogColor(true, true));
    CHECK_FALSE(ResolveLogColor(false, true));
}

TEST_CASE("ResolveLogColor: --color forces color even with NO_COLOR", "[core][terminal]") {
    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    CHECK(ResolveLogColor(true, false));
    unsetenv("NO_COLOR");
}

TEST_CASE("ResolveLogColor: NO_COLOR disables automatic color", "[core][terminal]") {
    setenv("NO_COLOR", "1", 1);
    CHECK_FALSE(ResolveLogColor(false, false));
    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}

TEST_CASE("ResolveLogColor: otherwise follows stderr", "[core][terminal]") {
    unsetenv("NO_COLOR");
    CHECK(ResolveLogColor(false, false) == IsStderrTty());
}
