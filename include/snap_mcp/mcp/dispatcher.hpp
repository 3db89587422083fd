#pragma once

#include <snap_mcp/core/result.hpp>
#include <snap_mcp/integration/i_integration_service.hpp>
#include <snap_mcp/mcp/capabilities.hpp>
#include <snap_mcp/mcp/protocol.hpp>

#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// Dispatcher - routes a decoded request to its method handler.
//
// Methods: initialize, tools/list, tools/call, resources/list,
// resources/read. Anything else is MethodNotFound. Process() never throws;
// every failure, including exceptions from the integration service, becomes
// an error response.
//
// Holds no mutable state, so one instance serves all connections
// concurrently; the integration service must be thread-safe.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const Capabilities& capabilities, IIntegrationService& integration);

    [[nodiscard]] Response Process(const Request& request) const;

    /// Decode one framed line and process it. Decode failures become error
    /// responses (id null unless the id could be recovered).
    [[nodiscard]] Response ProcessLine(std::string_view line) const;

private:
    // Ok: text for the content block. Err: the complete error frame.
    using ToolHandler =
        Result<std::string, RpcError> (Dispatcher::*)(const nlohmann::json& arguments) const;
    // Ok: JSON payload, serialized into the resource's "text".
    using ResourceReader = Result<nlohmann::json, RpcError> (Dispatcher::*)() const;

    Response Route(const Request& request) const;

    Response HandleInitialize(const Request& request) const;
    Response HandleToolsList(const Request& request) const;
    Response HandleToolsCall(const Request& request) const;
    Response HandleResourcesList(const Request& request) const;
    Response HandleResourcesRead(const Request& request) const;

    Result<std::string, RpcError> CapturePhoto(const nlohmann::json& arguments) const;
    Result<std::string, RpcError> SendSnap(const nlohmann::json& arguments) const;
    Result<std::string, RpcError> GetFriends(const nlohmann::json& arguments) const;

    Result<nlohmann::json, RpcError> ReadCameraStatus() const;
    Result<nlohmann::json, RpcError> ReadUserProfile() const;
    Result<nlohmann::json, RpcError> ReadFriendsList() const;

    const Capabilities& capabilities_;
    IIntegrationService& integration_;
    std::map<std::string, ToolHandler> tool_handlers_;
    std::map<std::string, ResourceReader> resource_readers_;
};

} // namespace snap_mcp
