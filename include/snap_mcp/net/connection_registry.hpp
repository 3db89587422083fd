#pragma once

#include <snap_mcp/net/connection.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// ConnectionRegistry - the open connections and their threads.
//
// A connection is in the open set exactly while it is Ready: Close() and
// CloseAll() flip the state and erase the entry in one critical section, so
// OpenCount() never counts a Closed connection.
//
// Each worker thread holds a shared_ptr to the registry and to its
// Connection (and through it the Dispatcher), so a thread detached by
// Drain() stays memory-safe after the server is gone.
// ---------------------------------------------------------------------------
class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry> {
public:
    ConnectionRegistry() = default;
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    [[nodiscard]] ConnectionId NextId();

    /// Add a Ready connection and start a thread running its Run().
    void Launch(std::shared_ptr<Connection> connection);

    /// Ready -> Closed plus removal from the open set. True for the caller
    /// that performed the transition.
    bool Close(Connection& connection);

    /// Close every open connection and shut its socket down. Returns how
    /// many were closed.
    size_t CloseAll();

    [[nodiscard]] size_t OpenCount() const;

    /// Join threads whose Run() has returned.
    void ReapExited();

    /// Wait up to grace for every thread to exit. Threads that exited are
    /// joined; the rest (stuck in a handler) are detached. Returns the
    /// number detached.
    size_t Drain(std::chrono::milliseconds grace);

private:
    void Exited(ConnectionId id);
    bool AllExitedLocked() const;

    mutable std::mutex mutex_;
    std::condition_variable exited_cv_;
    std::map<ConnectionId, std::shared_ptr<Connection>> open_;
    std::map<ConnectionId, std::thread> threads_;
    std::set<ConnectionId> exited_;
    ConnectionId next_id_ = 1;
};

} // namespace snap_mcp
