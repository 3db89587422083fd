#include <snap_mcp/mcp/dispatcher.hpp>

#include <snap_mcp/core/base64.hpp>
#include <snap_mcp/core/log.hpp>
#include <snap_mcp/core/version.hpp>
#include <snap_mcp/mcp/message_codec.hpp>
#include <snap_mcp/mcp/schema.hpp>

#include <optional>
#include <string>
#include <vector>

namespace snap_mcp {

namespace {

constexpr const char* kComponent = "dispatcher";
constexpr int kDefaultSnapDuration = 5;

// ---------------------------------------------------------------------------
// Error frame helpers
// ---------------------------------------------------------------------------

RpcError MakeRpcError(int code, std::string message,
                      std::optional<nlohmann::json> data = std::nullopt) {
    return RpcError{code, std::move(message), std::move(data)};
}

RpcError InvalidParams(const std::string& message, const std::string& field) {
    return MakeRpcError(rpc_code::kInvalidParams, message, nlohmann::json{{"field", field}});
}

// An integration failure for a tool or resource. subject_key is "tool" or
// "resource".
RpcError IntegrationFailure(const char* subject_key, const std::string& subject,
                            const Error& error) {
    LogWarn(kComponent, std::string(subject_key) + " " + subject + " failed: " +
                            error.ToString());
    return MakeRpcError(rpc_code::kToolExecutionError, error.message,
                        nlohmann::json{{subject_key, subject},
                                       {"category", error.CategoryName()},
                                       {"operation", error.operation}});
}

RpcError UnexpectedException(const char* subject_key, const std::string& subject,
                             const std::exception& e) {
    LogError(kComponent, std::string(subject_key) + " " + subject + " threw: " + e.what());
    return MakeRpcError(rpc_code::kToolExecutionError,
                        std::string("Tool error: ") + e.what(),
                        nlohmann::json{{subject_key, subject}, {"category", "internal"}});
}

nlohmann::json TextContent(const std::string& text) {
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})}};
}

// Get an optional object member of params. Returns nullopt when present
// with the wrong type.
std::optional<std::string> StringParam(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

int IntegralValue(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    return static_cast<int>(value.get<double>());
}

} // anonymous namespace

Dispatcher::Dispatcher(const Capabilities& capabilities, IIntegrationService& integration)
    : capabilities_(capabilities), integration_(integration) {
    tool_handlers_[tool_name::kCapturePhoto] = &Dispatcher::CapturePhoto;
    tool_handlers_[tool_name::kSendSnap] = &Dispatcher::SendSnap;
    tool_handlers_[tool_name::kGetFriends] = &Dispatcher::GetFriends;

    resource_readers_[resource_uri::kCameraStatus] = &Dispatcher::ReadCameraStatus;
    resource_readers_[resource_uri::kUserProfile] = &Dispatcher::ReadUserProfile;
    resource_readers_[resource_uri::kFriendsList] = &Dispatcher::ReadFriendsList;
}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------
Response Dispatcher::Process(const Request& request) const {
    try {
        return Route(request);
    } catch (const std::exception& e) {
        LogError(kComponent, "Unhandled exception in " + request.method + ": " + e.what());
        return Response::Failure(request.id,
                                 MakeRpcError(rpc_code::kInternalError,
                                              std::string("Internal error: ") + e.what()));
    }
}

Response Dispatcher::ProcessLine(std::string_view line) const {
    auto decoded = DecodeRequest(line);
    if (decoded.IsErr()) {
        auto failure = std::move(decoded).Error();
        LogWarn(kComponent, "Rejected message: " + failure.error.message);
        return Response::Failure(std::move(failure.id), std::move(failure.error));
    }
    return Process(decoded.Value());
}

Response Dispatcher::Route(const Request& request) const {
    LogDebug(kComponent, "Processing method " + request.method);

    if (request.method == "initialize") {
        return HandleInitialize(request);
    } else if (request.method == "tools/list") {
        return HandleToolsList(request);
    } else if (request.method == "tools/call") {
        return HandleToolsCall(request);
    } else if (request.method == "resources/list") {
        return HandleResourcesList(request);
    } else if (request.method == "resources/read") {
        return HandleResourcesRead(request);
    }
    return Response::Failure(request.id,
                             MakeRpcError(rpc_code::kMethodNotFound,
                                          "Method not found: " + request.method));
}

// ---------------------------------------------------------------------------
// initialize / list methods
// ---------------------------------------------------------------------------
Response Dispatcher::HandleInitialize(const Request& request) const {
    if (request.params.has_value()) {
        auto client = request.params->find("clientInfo");
        if (client != request.params->end() && client->is_object()) {
            auto name = StringParam(*client, "name");
            LogInfo(kComponent, "Client initialized: " + name.value_or("unknown"));
        }
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", true}}},
        {"resources", {{"listChanged", true}, {"subscribe", false}}}
    };
    result["serverInfo"] = {
        {"name", "snap-mcp"},
        {"version", kVersion},
        {"description", "Snap camera, messaging and friends MCP server"}
    };
    return Response::Success(request.id, std::move(result));
}

Response Dispatcher::HandleToolsList(const Request& request) const {
    return Response::Success(request.id, {{"tools", capabilities_.ToolsJson()}});
}

Response Dispatcher::HandleResourcesList(const Request& request) const {
    return Response::Success(request.id, {{"resources", capabilities_.ResourcesJson()}});
}

// ---------------------------------------------------------------------------
// tools/call
// ---------------------------------------------------------------------------
Response Dispatcher::HandleToolsCall(const Request& request) const {
    const auto params = request.params.value_or(nlohmann::json::object());

    auto name = StringParam(params, "name");
    if (!name) {
        return Response::Failure(request.id,
                                 InvalidParams("Invalid params: missing tool name", "name"));
    }

    const Tool* tool = capabilities_.FindTool(*name);
    if (tool == nullptr) {
        return Response::Failure(request.id,
                                 MakeRpcError(rpc_code::kMethodNotFound,
                                              "Unknown tool: " + *name));
    }
    auto handler = tool_handlers_.find(*name);
    if (handler == tool_handlers_.end()) {
        return Response::Failure(request.id,
                                 MakeRpcError(rpc_code::kInternalError,
                                              "Tool has no handler: " + *name));
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (auto it = params.find("arguments"); it != params.end() && !it->is_null()) {
        if (!it->is_object()) {
            return Response::Failure(
                request.id,
                InvalidParams("Invalid params: arguments must be an object", "arguments"));
        }
        arguments = *it;
    }

    if (auto violation = ValidateAgainstSchema(tool->input_schema, arguments)) {
        return Response::Failure(
            request.id,
            InvalidParams("Invalid arguments for " + *name + ": " +
                              (violation->field.empty() ? "arguments" : violation->field) +
                              " " + violation->message,
                          violation->field));
    }

    LogInfo(kComponent, "Calling tool " + *name);

    Result<std::string, RpcError> outcome = Result<std::string, RpcError>::Err(RpcError{});
    try {
        outcome = (this->*handler->second)(arguments);
    } catch (const std::exception& e) {
        return Response::Failure(request.id, UnexpectedException("tool", *name, e));
    }

    if (outcome.IsErr()) {
        return Response::Failure(request.id, std::move(outcome).Error());
    }
    return Response::Success(request.id, TextContent(outcome.Value()));
}

Result<std::string, RpcError> Dispatcher::CapturePhoto(const nlohmann::json& arguments) const {
    using R = Result<std::string, RpcError>;

    auto quality_name = StringParam(arguments, "quality").value_or("medium");
    auto quality = ParsePhotoQuality(quality_name);
    if (!quality) {
        return R::Err(InvalidParams("Invalid arguments: unknown quality '" + quality_name + "'",
                                    "quality"));
    }

    auto result = integration_.CapturePhoto(*quality);
    if (result.IsErr()) {
        return R::Err(IntegrationFailure("tool", tool_name::kCapturePhoto, result.Error()));
    }
    return R::Ok(result.Value());
}

Result<std::string, RpcError> Dispatcher::SendSnap(const nlohmann::json& arguments) const {
    using R = Result<std::string, RpcError>;

    auto recipients = arguments.at("recipients").get<std::vector<std::string>>();

    int duration = kDefaultSnapDuration;
    if (auto it = arguments.find("duration"); it != arguments.end()) {
        duration = IntegralValue(*it);
    }

    std::optional<std::vector<uint8_t>> media;
    if (auto encoded = StringParam(arguments, "media")) {
        auto decoded = Base64Decode(*encoded);
        if (decoded.IsErr()) {
            return R::Err(InvalidParams("Invalid arguments: media is not valid Base64 (" +
                                            decoded.Error() + ")",
                                        "media"));
        }
        media = std::move(decoded).Value();
    }

    auto result = integration_.SendSnap(recipients, duration, media);
    if (result.IsErr()) {
        return R::Err(IntegrationFailure("tool", tool_name::kSendSnap, result.Error()));
    }
    return R::Ok(result.Value());
}

Result<std::string, RpcError> Dispatcher::GetFriends(const nlohmann::json& /*arguments*/) const {
    using R = Result<std::string, RpcError>;

    auto result = integration_.GetFriends();
    if (result.IsErr()) {
        return R::Err(IntegrationFailure("tool", tool_name::kGetFriends, result.Error()));
    }

    const auto& friends = result.Value();
    std::string text = "Found " + std::to_string(friends.size()) + " friends:";
    for (const auto& f : friends) {
        text += "\n- " + f.display_name + " (@" + f.username + ")";
    }
    return R::Ok(std::move(text));
}

// ---------------------------------------------------------------------------
// resources/read
// ---------------------------------------------------------------------------
Response Dispatcher::HandleResourcesRead(const Request& request) const {
    const auto params = request.params.value_or(nlohmann::json::object());

    auto uri = StringParam(params, "uri");
    if (!uri) {
        return Response::Failure(request.id,
                                 InvalidParams("Invalid params: missing URI", "uri"));
    }

    const Resource* resource = capabilities_.FindResource(*uri);
    if (resource == nullptr) {
        return Response::Failure(request.id,
                                 InvalidParams("Unknown resource URI: " + *uri, "uri"));
    }
    auto reader = resource_readers_.find(*uri);
    if (reader == resource_readers_.end()) {
        return Response::Failure(request.id,
                                 MakeRpcError(rpc_code::kInternalError,
                                              "Resource has no reader: " + *uri));
    }

    Result<nlohmann::json, RpcError> payload = Result<nlohmann::json, RpcError>::Err(RpcError{});
    try {
        payload = (this->*reader->second)();
    } catch (const std::exception& e) {
        return Response::Failure(request.id, UnexpectedException("resource", *uri, e));
    }
    if (payload.IsErr()) {
        return Response::Failure(request.id, std::move(payload).Error());
    }

    nlohmann::json content = {
        {"uri", resource->uri},
        {"mimeType", resource->mime_type},
        {"text", payload.Value().dump()}
    };
    return Response::Success(request.id,
                             {{"contents", nlohmann::json::array({content})}});
}

Result<nlohmann::json, RpcError> Dispatcher::ReadCameraStatus() const {
    return Result<nlohmann::json, RpcError>::Ok(ToJson(integration_.GetCameraStatus()));
}

Result<nlohmann::json, RpcError> Dispatcher::ReadUserProfile() const {
    using R = Result<nlohmann::json, RpcError>;

    auto profile = integration_.GetUserProfile();
    if (!profile) {
        return R::Err(IntegrationFailure(
            "resource", resource_uri::kUserProfile,
            Error{"GetUserProfile", "User profile unavailable: no user is signed in",
                  ErrorCategory::AuthenticationRequired, std::nullopt}));
    }
    return R::Ok(ToJson(*profile));
}

Result<nlohmann::json, RpcError> Dispatcher::ReadFriendsList() const {
    using R = Result<nlohmann::json, RpcError>;

    auto result = integration_.GetFriends();
    if (result.IsErr()) {
        return R::Err(IntegrationFailure("resource", resource_uri::kFriendsList,
                                         result.Error()));
    }

    nlohmann::json friends = nlohmann::json::array();
    for (const auto& f : result.Value()) {
        friends.push_back(ToJson(f));
    }
    const auto total = friends.size();
    return R::Ok(nlohmann::json{{"friends", std::move(friends)}, {"total", total}});
}

} // namespace snap_mcp
