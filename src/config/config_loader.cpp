#include <snap_mcp/config/config_loader.hpp>

#include <snap_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <string>

namespace snap_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, std::nullopt};
}

Result<uint16_t, Error> CheckPort(int value, const std::string& source) {
    if (value < 0 || value > 65535) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Invalid " + source + ": " + std::to_string(value) +
                            " (expected 0-65535)"));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);

    try {
        // -- Server --
        if (root["server"]) {
            const auto& server = root["server"];
            if (server["host"]) {
                config.server.host = server["host"].as<std::string>();
                config.server_set.host = true;
            }
            if (server["port"]) {
                auto port = CheckPort(server["port"].as<int>(), "server.port");
                if (port.IsErr()) {
                    return Result<AppConfig, Error>::Err(port.Error());
                }
                config.server.port = port.Value();
                config.server_set.port = true;
            }
            if (server["backlog"]) {
                config.server.backlog = server["backlog"].as<int>();
                config.server_set.backlog = true;
            }
        }

        // -- Logging --
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_log"]) {
            config.json_log = root["json_log"].as<bool>();
        }
        if (root["color"]) {
            config.color = root["color"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " +
                            std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("snap-mcp", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Server flags
    program.add_argument("--host")
        .help("Address to bind (loopback only)");
    program.add_argument("--port")
        .help("TCP port (0 picks a free port)")
        .scan<'i', int>();
    program.add_argument("--backlog")
        .help("Listen backlog")
        .scan<'i', int>();

    // Logging flags
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Also append log output to this file");
    program.add_argument("--json-log")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Info-level logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Debug-level logging")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // Unknown flags raise runtime_error; bad numbers raise invalid_argument.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }

    // Server
    if (auto val = program.present("--host")) {
        config.server.host = *val;
        config.server_set.host = true;
    }
    if (auto val = program.present<int>("--port")) {
        auto port = CheckPort(*val, "--port");
        if (port.IsErr()) {
            return Result<AppConfig, Error>::Err(port.Error());
        }
        config.server.port = port.Value();
        config.server_set.port = true;
    }
    if (auto val = program.present<int>("--backlog")) {
        config.server.backlog = *val;
        config.server_set.backlog = true;
    }

    // Logging
    if (auto val = program.present("--log-level")) {
        config.log_level = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--json-log")) {
        config.json_log = true;
    }
    if (program.get<bool>("--color")) {
        config.color = true;
    }
    if (program.get<bool>("--no-color")) {
        config.color = false;
    }
    if (program.get<bool>("-vv")) {
        config.verbosity = 2;
    } else if (program.get<bool>("--verbose")) {
        config.verbosity = 1;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& file_base, const AppConfig& cli_overrides) {
    AppConfig merged = file_base;

    if (cli_overrides.server_set.host) {
        merged.server.host = cli_overrides.server.host;
        merged.server_set.host = true;
    }
    if (cli_overrides.server_set.port) {
        merged.server.port = cli_overrides.server.port;
        merged.server_set.port = true;
    }
    if (cli_overrides.server_set.backlog) {
        merged.server.backlog = cli_overrides.server.backlog;
        merged.server_set.backlog = true;
    }

    if (cli_overrides.log_level.has_value()) {
        merged.log_level = cli_overrides.log_level;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_log) {
        merged.json_log = true;
    }
    if (cli_overrides.color.has_value()) {
        merged.color = cli_overrides.color;
    }
    if (cli_overrides.verbosity > merged.verbosity) {
        merged.verbosity = cli_overrides.verbosity;
    }
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    const auto& host = config.server.host;
    if (host.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: host"));
    }
    if (host != "127.0.0.1" && host != "localhost") {
        return Result<void, Error>::Err(
            MakeConfigError("Refusing to bind non-loopback host '" + host +
                            "' (use 127.0.0.1 or localhost)"));
    }
    if (config.server.backlog <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid backlog: " + std::to_string(config.server.backlog)));
    }
    if (config.log_level.has_value() && !ParseLogLevel(*config.log_level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + *config.log_level));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// EffectiveLogLevel
// ---------------------------------------------------------------------------
LogLevel EffectiveLogLevel(const AppConfig& config) {
    if (config.verbosity >= 2) {
        return LogLevel::Debug;
    }
    if (config.verbosity == 1) {
        return LogLevel::Info;
    }
    if (config.log_level.has_value()) {
        if (auto level = ParseLogLevel(*config.log_level)) {
            return *level;
        }
    }
    return LogLevel::Warn;
}

} // namespace snap_mcp
