#include <snap_mcp/net/connection.hpp>

#include <snap_mcp/core/log.hpp>
#include <snap_mcp/mcp/message_codec.hpp>
#include <snap_mcp/net/connection_registry.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace snap_mcp {

namespace {

constexpr const char* kComponent = "connection";

std::string Tag(ConnectionId id) {
    return "#" + std::to_string(id) + " ";
}

} // anonymous namespace

Connection::Connection(ConnectionId id, Socket socket,
                       std::shared_ptr<const Dispatcher> dispatcher,
                       ConnectionRegistry& registry)
    : id_(id), socket_(std::move(socket)), dispatcher_(std::move(dispatcher)),
      registry_(registry) {}

void Connection::Run() {
    std::vector<char> chunk(kReadChunkSize);
    LineBuffer buffer;

    while (state_.load() == ConnectionState::Ready) {
        auto received = socket_.Read(chunk.data(), chunk.size());
        if (received.IsErr()) {
            if (state_.load() == ConnectionState::Ready) {
                LogWarn(kComponent, Tag(id_) + "read failed: " + received.Error().ToString());
            }
            break;
        }
        if (received.Value() == 0) {
            LogDebug(kComponent, Tag(id_) + "peer closed the stream");
            break;
        }

        buffer.Append(std::string_view(chunk.data(), received.Value()));

        bool write_failed = false;
        while (auto line = buffer.NextLine()) {
            auto response = dispatcher_->ProcessLine(*line);
            auto written = socket_.WriteAll(EncodeResponse(response));
            if (written.IsErr()) {
                LogWarn(kComponent, Tag(id_) + "write failed: " + written.Error().ToString());
                write_failed = true;
                break;
            }
        }
        if (write_failed) {
            break;
        }
    }

    Close();
    if (buffer.PendingBytes() > 0) {
        LogDebug(kComponent, Tag(id_) + "discarded " + std::to_string(buffer.PendingBytes()) +
                                 " bytes of an unterminated message");
    }
}

void Connection::Close() {
    if (registry_.Close(*this)) {
        socket_.Shutdown();
    }
}

bool Connection::MarkClosed() noexcept {
    auto expected = ConnectionState::Ready;
    return state_.compare_exchange_strong(expected, ConnectionState::Closed);
}

} // namespace snap_mcp
