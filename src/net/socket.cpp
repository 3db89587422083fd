#include <snap_mcp/net/socket.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace snap_mcp {

namespace {

Result<in_addr, Error> ResolveIpv4(const std::string& host, const char* operation) {
    in_addr address{};
    if (::inet_pton(AF_INET, host.c_str(), &address) == 1) {
        return Result<in_addr, Error>::Ok(address);
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* found = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
        return Result<in_addr, Error>::Err(
            Error{operation, "Cannot resolve host '" + host + "': " + ::gai_strerror(rc),
                  ErrorCategory::Config, std::nullopt});
    }
    address = reinterpret_cast<sockaddr_in*>(found->ai_addr)->sin_addr;
    ::freeaddrinfo(found);
    return Result<in_addr, Error>::Ok(address);
}

sockaddr_in MakeAddress(in_addr host, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr = host;
    addr.sin_port = htons(port);
    return addr;
}

} // anonymous namespace

Socket::~Socket() {
    Close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void Socket::Close() noexcept {
    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ---------------------------------------------------------------------------
// Listen / Connect
// ---------------------------------------------------------------------------
Result<Socket, Error> Socket::Listen(const std::string& host, uint16_t port,
                                     int backlog) {
    using R = Result<Socket, Error>;

    auto address = ResolveIpv4(host, "Listen");
    if (address.IsErr()) {
        return R::Err(address.Error());
    }

    Socket socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!socket.Valid()) {
        return R::Err(Error::FromErrno("socket", errno));
    }

    int opt = 1;
    if (::setsockopt(socket.fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) {
        return R::Err(Error::FromErrno("setsockopt", errno));
    }

    auto addr = MakeAddress(address.Value(), port);
    if (::bind(socket.fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        auto error = Error::FromErrno("bind", errno);
        error.message = host + ":" + std::to_string(port) + ": " + error.message;
        return R::Err(std::move(error));
    }

    if (::listen(socket.fd_, backlog) == -1) {
        return R::Err(Error::FromErrno("listen", errno));
    }
    return R::Ok(std::move(socket));
}

Result<Socket, Error> Socket::Connect(const std::string& host, uint16_t port) {
    using R = Result<Socket, Error>;

    auto address = ResolveIpv4(host, "Connect");
    if (address.IsErr()) {
        return R::Err(address.Error());
    }

    Socket socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!socket.Valid()) {
        return R::Err(Error::FromErrno("socket", errno));
    }

    auto addr = MakeAddress(address.Value(), port);
    int rc;
    do {
        rc = ::connect(socket.fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    } while (rc == -1 && errno == EINTR);
    if (rc == -1) {
        return R::Err(Error::FromErrno("connect", errno));
    }
    return R::Ok(std::move(socket));
}

// ---------------------------------------------------------------------------
// Accept / Read / Write
// ---------------------------------------------------------------------------
Result<Socket, Error> Socket::Accept() const {
    for (;;) {
        int client = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client != -1) {
            return Result<Socket, Error>::Ok(Socket(client));
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        return Result<Socket, Error>::Err(Error::FromErrno("accept", errno));
    }
}

Result<size_t, Error> Socket::Read(char* buf, size_t len) const {
    for (;;) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0) {
            return Result<size_t, Error>::Ok(static_cast<size_t>(n));
        }
        if (errno == EINTR) {
            continue;
        }
        return Result<size_t, Error>::Err(Error::FromErrno("recv", errno));
    }
}

Result<void, Error> Socket::WriteAll(std::string_view data) const {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::send(fd_, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Result<void, Error>::Err(Error::FromErrno("send", errno));
        }
        offset += static_cast<size_t>(n);
    }
    return Result<void, Error>::Ok();
}

void Socket::Shutdown() const noexcept {
    if (fd_ != -1) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

Result<uint16_t, Error> Socket::LocalPort() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1) {
        return Result<uint16_t, Error>::Err(Error::FromErrno("getsockname", errno));
    }
    return Result<uint16_t, Error>::Ok(ntohs(addr.sin_port));
}

} // namespace snap_mcp
