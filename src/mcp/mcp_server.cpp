#include <snap_mcp/mcp/mcp_server.hpp>

#include <snap_mcp/core/log.hpp>

#include <stdexcept>
#include <string>

namespace snap_mcp {

namespace {

constexpr const char* kComponent = "server";
constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(50);

// Owns what the Dispatcher references, so a Dispatcher handed out through
// an aliasing shared_ptr keeps its collaborators alive.
struct DispatchBackend {
    DispatchBackend(std::shared_ptr<const Capabilities> caps,
                    std::shared_ptr<IIntegrationService> service)
        : capabilities(std::move(caps)),
          integration(std::move(service)),
          dispatcher(*capabilities, *integration) {}

    std::shared_ptr<const Capabilities> capabilities;
    std::shared_ptr<IIntegrationService> integration;
    Dispatcher dispatcher;
};

std::shared_ptr<const Dispatcher> MakeDispatcher(
    std::shared_ptr<const Capabilities> capabilities,
    std::shared_ptr<IIntegrationService> integration) {
    if (!capabilities || !integration) {
        throw std::invalid_argument("McpServer needs capabilities and an integration service");
    }
    auto backend =
        std::make_shared<DispatchBackend>(std::move(capabilities), std::move(integration));
    return std::shared_ptr<const Dispatcher>(backend, &backend->dispatcher);
}

} // anonymous namespace

McpServer::McpServer(ServerConfig config, std::shared_ptr<const Capabilities> capabilities,
                     std::shared_ptr<IIntegrationService> integration)
    : config_(std::move(config)),
      dispatcher_(MakeDispatcher(std::move(capabilities), std::move(integration))),
      registry_(std::make_shared<ConnectionRegistry>()) {}

McpServer::~McpServer() {
    Stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> McpServer::Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) {
        return Result<void, Error>::Ok();
    }

    auto listening = Socket::Listen(config_.host, config_.port, config_.backlog);
    if (listening.IsErr()) {
        LogError(kComponent, "Failed to start: " + listening.Error().ToString());
        return Result<void, Error>::Err(listening.Error());
    }
    auto socket = std::move(listening).Value();

    auto bound = socket.LocalPort();
    if (bound.IsErr()) {
        return Result<void, Error>::Err(bound.Error());
    }

    listener_ = std::move(socket);
    port_.store(bound.Value());
    stopping_.store(false);
    running_.store(true);
    accept_thread_ = std::thread([this]() { AcceptLoop(); });

    LogInfo(kComponent, "Listening on " + config_.host + ":" + std::to_string(bound.Value()));
    return Result<void, Error>::Ok();
}

void McpServer::Stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }

    stopping_.store(true);
    listener_.Shutdown();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    listener_.Close();

    const size_t closed = registry_->CloseAll();
    const size_t detached = registry_->Drain(kStopGracePeriod);
    if (detached > 0) {
        LogWarn(kComponent, std::to_string(detached) +
                                " connection thread(s) still inside a handler; detached");
    }

    port_.store(0);
    running_.store(false);
    LogInfo(kComponent, "Stopped (" + std::to_string(closed) + " connection(s) closed)");
}

size_t McpServer::ConnectedClients() const {
    return registry_->OpenCount();
}

// ---------------------------------------------------------------------------
// Accept loop
// ---------------------------------------------------------------------------
void McpServer::AcceptLoop() {
    while (!stopping_.load()) {
        auto accepted = listener_.Accept();
        registry_->ReapExited();

        if (accepted.IsErr()) {
            if (stopping_.load()) {
                break;
            }
            LogWarn(kComponent, "accept failed: " + accepted.Error().ToString());
            std::this_thread::sleep_for(kAcceptRetryDelay);
            continue;
        }
        if (stopping_.load()) {
            break;
        }

        const ConnectionId id = registry_->NextId();
        registry_->Launch(std::make_shared<Connection>(id, std::move(accepted).Value(),
                                                       dispatcher_, *registry_));
    }
    LogDebug(kComponent, "Accept loop finished");
}

} // namespace snap_mcp
