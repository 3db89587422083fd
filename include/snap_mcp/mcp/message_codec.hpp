#pragma once

#include <snap_mcp/core/result.hpp>
#include <snap_mcp/mcp/protocol.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// DecodeFailure - why a line could not become a Request.
//
// id holds the request id when the document was a JSON object carrying a
// usable one, so the error response can still be correlated.
// ---------------------------------------------------------------------------
struct DecodeFailure {
    nlohmann::json id;
    RpcError error;
};

/// Decode one complete line (without its terminator) into a Request.
/// Never throws: malformed JSON, invalid UTF-8, non-object documents and a
/// missing method are ParseError; a wrong "jsonrpc", an id of the wrong type
/// or non-object params are InvalidRequest.
Result<Request, DecodeFailure> DecodeRequest(std::string_view line);

/// Serialize with sorted keys and append '\n'.
std::string EncodeResponse(const Response& response);
std::string EncodeRequest(const Request& request);

/// The JSON form of a response, before framing.
nlohmann::json ResponseToJson(const Response& response);

/// Parse a response line; used by clients and tests.
Result<Response, std::string> DecodeResponse(std::string_view line);

// ---------------------------------------------------------------------------
// LineBuffer - accumulates stream bytes and yields complete lines.
//
// A trailing '\r' is stripped (CRLF clients) and blank lines are skipped.
// Bytes after the last '\n' stay buffered until more data arrives.
// ---------------------------------------------------------------------------
class LineBuffer {
public:
    void Append(std::string_view bytes);

    [[nodiscard]] std::optional<std::string> NextLine();

    [[nodiscard]] size_t PendingBytes() const noexcept {
        return buffer_.size() - consumed_;
    }

private:
    void Compact();

    std::string buffer_;
    size_t consumed_ = 0;
};

} // namespace snap_mcp
