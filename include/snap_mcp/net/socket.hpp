#pragma once

#include <snap_mcp/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// Socket - move-only owner of a POSIX TCP socket descriptor (IPv4).
//
// Shutdown() may be called from another thread while Accept() or Read() is
// blocked; it unblocks them without invalidating the descriptor, which is
// only closed by the destructor or Close().
// ---------------------------------------------------------------------------
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : fd_(fd) {}
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    /// Bind host:port (port 0 picks an ephemeral port) and listen.
    static Result<Socket, Error> Listen(const std::string& host, uint16_t port,
                                        int backlog);

    /// Blocking connect to host:port.
    static Result<Socket, Error> Connect(const std::string& host, uint16_t port);

    /// Block until a client connects. Retries on EINTR and ECONNABORTED.
    [[nodiscard]] Result<Socket, Error> Accept() const;

    /// Read up to len bytes. Ok(0) means the peer closed the stream.
    [[nodiscard]] Result<size_t, Error> Read(char* buf, size_t len) const;

    /// Write every byte of data. Never raises SIGPIPE.
    [[nodiscard]] Result<void, Error> WriteAll(std::string_view data) const;

    /// shutdown(SHUT_RDWR). Errors (e.g. ENOTCONN) are ignored.
    void Shutdown() const noexcept;

    void Close() noexcept;

    [[nodiscard]] Result<uint16_t, Error> LocalPort() const;

    [[nodiscard]] int Fd() const noexcept { return fd_; }
    [[nodiscard]] bool Valid() const noexcept { return fd_ != -1; }

private:
    int fd_ = -1;
};

} // namespace snap_mcp
