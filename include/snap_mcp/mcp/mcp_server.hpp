#pragma once

#include <snap_mcp/config/app_config.hpp>
#include <snap_mcp/core/result.hpp>
#include <snap_mcp/integration/i_integration_service.hpp>
#include <snap_mcp/mcp/capabilities.hpp>
#include <snap_mcp/mcp/dispatcher.hpp>
#include <snap_mcp/net/connection.hpp>
#include <snap_mcp/net/connection_registry.hpp>
#include <snap_mcp/net/socket.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// McpServer - MCP 2024-11-05 server over loopback TCP.
//
// One accept thread plus one thread per client. Each client speaks
// newline-delimited JSON-RPC 2.0; see Dispatcher for the methods.
//
// ConnectedClients() counts connections in the Ready state: a connection
// leaves the registry when it closes, whether the peer hung up, I/O failed or
// Stop() closed it.
//
// Stop() does not wait for a handler stuck in the integration service: after
// kStopGracePeriod such threads are detached. They own shared_ptrs to the
// Dispatcher, the Capabilities and the integration service, which therefore
// outlive the server as long as they need to.
// ---------------------------------------------------------------------------
class McpServer {
public:
    static constexpr std::chrono::milliseconds kStopGracePeriod{500};

    McpServer(ServerConfig config, std::shared_ptr<const Capabilities> capabilities,
              std::shared_ptr<IIntegrationService> integration);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Bind, listen and start accepting. No-op when already running.
    [[nodiscard]] Result<void, Error> Start();

    /// Stop accepting and close every connection. Returns within
    /// kStopGracePeriod plus the accept thread's exit. No-op when not running.
    void Stop();

    [[nodiscard]] bool IsRunning() const noexcept { return running_.load(); }
    [[nodiscard]] size_t ConnectedClients() const;

    /// Bound port (the ephemeral one when configured with port 0); 0 when
    /// not running.
    [[nodiscard]] uint16_t Port() const noexcept { return port_.load(); }

private:
    void AcceptLoop();

    ServerConfig config_;
    std::shared_ptr<const Dispatcher> dispatcher_;
    std::shared_ptr<ConnectionRegistry> registry_;

    std::mutex lifecycle_mutex_;   // serializes Start/Stop
    Socket listener_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<uint16_t> port_{0};
};

} // namespace snap_mcp
