#include <snap_mcp/net/connection_registry.hpp>

#include <snap_mcp/core/log.hpp>

#include <string>

namespace snap_mcp {

namespace {

constexpr const char* kComponent = "server";

} // anonymous namespace

ConnectionRegistry::~ConnectionRegistry() {
    // Every worker holds a shared_ptr to the registry, so any thread left
    // here has finished running; the last one may be the current thread.
    for (auto& entry : threads_) {
        if (entry.second.joinable()) {
            entry.second.detach();
        }
    }
}

ConnectionId ConnectionRegistry::NextId() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_++;
}

void ConnectionRegistry::Launch(std::shared_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const ConnectionId id = connection->Id();
    open_[id] = connection;

    // The thread cannot reach Close() or Exited() before mutex_ is
    // released, so both entries exist by then.
    threads_[id] = std::thread([self = shared_from_this(), connection]() {
        connection->Run();
        self->Exited(connection->Id());
    });

    LogInfo(kComponent, "Client #" + std::to_string(id) + " connected (" +
                            std::to_string(open_.size()) + " connected)");
}

bool ConnectionRegistry::Close(Connection& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connection.MarkClosed()) {
        return false;
    }
    open_.erase(connection.Id());
    LogInfo(kComponent, "Client #" + std::to_string(connection.Id()) + " disconnected (" +
                            std::to_string(open_.size()) + " connected)");
    return true;
}

size_t ConnectionRegistry::CloseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t closed = 0;
    for (auto& entry : open_) {
        if (entry.second->MarkClosed()) {
            entry.second->socket_.Shutdown();
            ++closed;
        }
    }
    open_.clear();
    return closed;
}

size_t ConnectionRegistry::OpenCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_.size();
}

void ConnectionRegistry::ReapExited() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (ConnectionId id : exited_) {
            auto it = threads_.find(id);
            if (it != threads_.end()) {
                finished.push_back(std::move(it->second));
                threads_.erase(it);
            }
        }
        exited_.clear();
    }
    for (auto& t : finished) {
        if (t.joinable()) {
            t.join();
        }
    }
}

size_t ConnectionRegistry::Drain(std::chrono::milliseconds grace) {
    std::vector<std::thread> finished;
    std::vector<std::thread> busy;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        exited_cv_.wait_for(lock, grace, [this]() { return AllExitedLocked(); });
        for (auto& entry : threads_) {
            if (exited_.count(entry.first) > 0) {
                finished.push_back(std::move(entry.second));
            } else {
                busy.push_back(std::move(entry.second));
            }
        }
        threads_.clear();
        exited_.clear();
    }

    // Exited threads only have their captures left to release.
    for (auto& t : finished) {
        if (t.joinable()) {
            t.join();
        }
    }
    for (auto& t : busy) {
        if (t.joinable()) {
            t.detach();
        }
    }
    return busy.size();
}

void ConnectionRegistry::Exited(ConnectionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    // A thread detached by Drain() is no longer tracked.
    if (threads_.count(id) > 0) {
        exited_.insert(id);
        exited_cv_.notify_all();
    }
}

bool ConnectionRegistry::AllExitedLocked() const {
    for (const auto& entry : threads_) {
        if (exited_.count(entry.first) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace snap_mcp
