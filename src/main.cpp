#include <snap_mcp/config/config_loader.hpp>
#include <snap_mcp/core/log.hpp>
#include <snap_mcp/core/terminal.hpp>
#include <snap_mcp/core/version.hpp>
#include <snap_mcp/integration/integration_service.hpp>
#include <snap_mcp/integration/simulated_host.hpp>
#include <snap_mcp/mcp/capabilities.hpp>
#include <snap_mcp/mcp/mcp_server.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <pthread.h>
#include <signal.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage   = 2;

constexpr const char* kComponent = "main";

struct SimulatedBackend {
    snap_mcp::SimulatedHost host;
    snap_mcp::IntegrationService integration{host.Services()};
};

void PrintUsage(std::ostream& out) {
    out << "Usage: snap-mcp <command> [options]\n"
           "\n"
           "Commands:\n"
           "  serve        Run the MCP server on a loopback TCP port\n"
           "\n"
           "Options:\n"
           "  --version    Print the version and exit\n"
           "  -h, --help   Show this help\n"
           "\n"
           "Run 'snap-mcp serve --help' for server options.\n";
}

void PrintError(const snap_mcp::Error& error) {
    std::cerr << "snap-mcp: " << error.ToString() << "\n";
}

// Strip the "serve" command so LoadFromCli sees only flags.
std::vector<const char*> StripCommand(int argc, const char* const* argv) {
    std::vector<const char*> args;
    args.push_back(argv[0]);
    bool stripped = false;
    for (int i = 1; i < argc; ++i) {
        if (!stripped && std::string_view{argv[i]} == "serve") {
            stripped = true;
            continue;
        }
        args.push_back(argv[i]);
    }
    return args;
}

// Resolve CLI flags and the optional YAML file into a validated config.
snap_mcp::Result<snap_mcp::AppConfig, snap_mcp::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace snap_mcp;
    using R = Result<AppConfig, Error>;

    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return R::Err(cli_result.Error());
    }
    auto config = std::move(cli_result).Value();

    if (config.config_file.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            return R::Err(yaml_result.Error());
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(config));
}

snap_mcp::Result<void, snap_mcp::Error> InitLogging(const snap_mcp::AppConfig& config) {
    using namespace snap_mcp;

    bool use_color = ResolveLogColor(config.color.value_or(false),
                                     config.color.has_value() && !*config.color);

    std::unique_ptr<ILogSink> console;
    if (config.json_log) {
        console = std::make_unique<JsonSink>(std::cerr);
    } else {
        console = std::make_unique<TextSink>(use_color);
    }

    if (!config.log_file.has_value()) {
        InitGlobalLogger(std::move(console), EffectiveLogLevel(config));
        return Result<void, Error>::Ok();
    }

    auto file = FileSink::Open(*config.log_file, config.json_log);
    if (file.IsErr()) {
        return Result<void, Error>::Err(file.Error());
    }
    auto multi = std::make_unique<MultiSink>();
    multi->Add(std::move(console));
    multi->Add(std::move(file).Value());
    InitGlobalLogger(std::move(multi), EffectiveLogLevel(config));
    return Result<void, Error>::Ok();
}

int RunServe(int argc, const char* const* argv) {
    using namespace snap_mcp;

    auto args = StripCommand(argc, argv);
    auto config_result = ResolveConfig(static_cast<int>(args.size()), args.data());
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return config_result.Error().ExitCode();
    }
    const auto config = std::move(config_result).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return logging.Error().ExitCode();
    }

    // Block the shutdown signals before any thread starts so that every
    // thread inherits the mask and only sigwait() below sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // IntegrationService points into the host, so both share one owner.
    auto backend = std::make_shared<SimulatedBackend>();
    std::shared_ptr<IIntegrationService> integration(backend, &backend->integration);
    auto capabilities = std::make_shared<const Capabilities>(Capabilities::Default());

    McpServer server(config.server, std::move(capabilities), std::move(integration));
    auto started = server.Start();
    if (started.IsErr()) {
        PrintError(started.Error());
        return started.Error().ExitCode();
    }

    std::cerr << "snap-mcp " << kVersion << " listening on " << config.server.host << ":"
              << server.Port() << "\n";

    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        LogError(kComponent, "sigwait failed; shutting down");
    } else {
        LogInfo(kComponent, std::string("Received ") +
                                (received == SIGINT ? "SIGINT" : "SIGTERM") +
                                ", shutting down");
    }

    server.Stop();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    if (argc == 1) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    std::string_view command{argv[1]};
    if (command == "--version") {
        std::cout << "snap-mcp " << snap_mcp::kVersion << "\n";
        return kExitSuccess;
    }
    if (command == "--help" || command == "-h") {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    // Flags may precede the command: snap-mcp -v serve.
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "serve") {
            return RunServe(argc, argv);
        }
    }

    std::cerr << "snap-mcp: unknown command '" << command << "'\n\n";
    PrintUsage(std::cerr);
    return kExitUsage;
}
