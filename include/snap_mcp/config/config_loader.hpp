#pragma once

#include <snap_mcp/config/app_config.hpp>
#include <snap_mcp/core/log.hpp>
#include <snap_mcp/core/result.hpp>

#include <string_view>

namespace snap_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments (argv[0] is the program name) into an AppConfig.
// Fields not given on the command line keep their defaults.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: values set explicitly in cli_overrides (server_set
// flags, engaged optionals, enabled switches) replace those in file_base.
AppConfig MergeConfigs(const AppConfig& file_base, const AppConfig& cli_overrides);

// Validate: loopback host only, backlog > 0, known log level.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Effective log level: verbosity flags win over log_level; default Warn.
LogLevel EffectiveLogLevel(const AppConfig& config);

} // namespace snap_mcp
