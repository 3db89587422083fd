#pragma once

#include <snap_mcp/mcp/dispatcher.hpp>
#include <snap_mcp/net/socket.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace snap_mcp {

using ConnectionId = uint64_t;

enum class ConnectionState {
    Ready,
    Closed,
};

class ConnectionRegistry;

// ---------------------------------------------------------------------------
// Connection - one client socket and its read/dispatch/write loop.
//
// Ready until the peer disconnects, a read or write fails, or Close() is
// called; then Closed for good. Responses go out in request order.
//
// The Ready -> Closed transition always goes through the registry, which
// drops the connection from its open set under the same lock.
// ---------------------------------------------------------------------------
class Connection {
public:
    static constexpr size_t kReadChunkSize = 64 * 1024;

    Connection(ConnectionId id, Socket socket, std::shared_ptr<const Dispatcher> dispatcher,
               ConnectionRegistry& registry);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Blocks on the connection thread until the connection is Closed.
    void Run();

    /// Unblocks Run() from any thread.
    void Close();

    [[nodiscard]] ConnectionId Id() const noexcept { return id_; }
    [[nodiscard]] ConnectionState State() const noexcept { return state_.load(); }

private:
    friend class ConnectionRegistry;

    // True only for the call that performed the Ready -> Closed transition.
    // Called with the registry lock held.
    bool MarkClosed() noexcept;

    const ConnectionId id_;
    Socket socket_;
    std::shared_ptr<const Dispatcher> dispatcher_;
    ConnectionRegistry& registry_;
    std::atomic<ConnectionState> state_{ConnectionState::Ready};
};

} // namespace snap_mcp
