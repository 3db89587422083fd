#include <snap_mcp/core/result.hpp>

#include <cerrno>
#include <cstring>

namespace snap_mcp {

namespace {

// strerror_r comes in two flavours; pick whichever the libc provides.
std::string DescribeErrno(int err) {
    char buf[256] = {};
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
    const char* msg = strerror_r(err, buf, sizeof(buf));
    return msg != nullptr ? std::string(msg) : std::string("unknown error");
#else
    if (strerror_r(err, buf, sizeof(buf)) != 0) {
        return "unknown error";
    }
    return std::string(buf);
#endif
}

} // anonymous namespace

Error Error::FromErrno(const std::string& operation, int err) {
    std::string message;
    switch (err) {
        case EADDRINUSE:
            message = "Address already in use; is another server running on this port?";
            break;
        case EACCES:
            message = "Permission denied";
            break;
        case EADDRNOTAVAIL:
            message = "Address not available on this host";
            break;
        case ECONNREFUSED:
            message = "Connection refused";
            break;
        case ECONNRESET:
            message = "Connection reset by peer";
            break;
        case EPIPE:
            message = "Broken pipe";
            break;
        default:
            message = DescribeErrno(err);
            break;
    }
    return Error{operation, message, ErrorCategory::Transport, err};
}

} // namespace snap_mcp
