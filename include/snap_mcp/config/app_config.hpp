#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace snap_mcp {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 8090;
    int backlog = 16;
};

// Server fields that were given explicitly, so a value equal to the default
// still overrides during MergeConfigs.
struct ServerFieldsSet {
    bool host = false;
    bool port = false;
    bool backlog = false;
};

struct AppConfig {
    ServerConfig server;
    ServerFieldsSet server_set;
    std::optional<std::string> log_level;   // debug, info, warn, error
    std::optional<std::string> log_file;
    bool json_log = false;
    std::optional<bool> color;               // unset: decide from the terminal
    int verbosity = 0;                       // -v = 1, -vv = 2
    std::optional<std::string> config_file;
};

} // namespace snap_mcp
