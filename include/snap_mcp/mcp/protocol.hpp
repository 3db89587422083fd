#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 error codes used on the wire.
// ---------------------------------------------------------------------------
namespace rpc_code {
constexpr int kParseError         = -32700;
constexpr int kInvalidRequest     = -32600;
constexpr int kMethodNotFound     = -32601;
constexpr int kInvalidParams      = -32602;
constexpr int kInternalError      = -32603;
constexpr int kToolExecutionError = -32000;
} // namespace rpc_code

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// RpcError - the "error" member of an error response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = rpc_code::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;  // always an object when present

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
};

// ---------------------------------------------------------------------------
// Request - one decoded JSON-RPC call.
//
// id is null when the caller sent none; string and integer ids are echoed
// back verbatim.
// ---------------------------------------------------------------------------
struct Request {
    nlohmann::json id;
    std::string method;
    std::optional<nlohmann::json> params;  // always an object when present

    bool operator==(const Request& other) const {
        return id == other.id && method == other.method &&
               params == other.params;
    }
};

// ---------------------------------------------------------------------------
// Response - either a result object or an RpcError, never both.
// ---------------------------------------------------------------------------
struct Response {
    using Body = std::variant<nlohmann::json, RpcError>;

    nlohmann::json id;
    Body body;

    static Response Success(nlohmann::json id, nlohmann::json result) {
        return Response{std::move(id),
                        Body(std::in_place_index<0>, std::move(result))};
    }

    static Response Failure(nlohmann::json id, RpcError error) {
        return Response{std::move(id),
                        Body(std::in_place_index<1>, std::move(error))};
    }

    [[nodiscard]] bool IsError() const noexcept { return body.index() == 1; }

    [[nodiscard]] const nlohmann::json& ResultBody() const {
        return std::get<0>(body);
    }

    [[nodiscard]] const RpcError& ErrorBody() const {
        return std::get<1>(body);
    }
};

} // namespace snap_mcp
