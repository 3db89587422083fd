#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// Tool - a named action a client can invoke through tools/call.
// ---------------------------------------------------------------------------
struct Tool {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// Resource - a read-only data source addressed by URI.
// ---------------------------------------------------------------------------
struct Resource {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "application/json";
};

namespace tool_name {
constexpr const char* kCapturePhoto = "capture_photo";
constexpr const char* kSendSnap     = "send_snap";
constexpr const char* kGetFriends   = "get_friends";
} // namespace tool_name

namespace resource_uri {
constexpr const char* kCameraStatus = "snap://camera/status";
constexpr const char* kUserProfile  = "snap://user/profile";
constexpr const char* kFriendsList  = "snap://friends/list";
} // namespace resource_uri

// ---------------------------------------------------------------------------
// Capabilities - the catalog of tools and resources a server advertises.
//
// Built once and never mutated afterwards, so one instance can be shared by
// every connection thread without locking. Listing preserves registration
// order.
// ---------------------------------------------------------------------------
class Capabilities {
public:
    Capabilities(std::vector<Tool> tools, std::vector<Resource> resources);

    /// The standard catalog: capture_photo, send_snap, get_friends and the
    /// camera status, user profile and friends list resources.
    static Capabilities Default();

    [[nodiscard]] const std::vector<Tool>& Tools() const noexcept {
        return tools_;
    }

    [[nodiscard]] const std::vector<Resource>& Resources() const noexcept {
        return resources_;
    }

    /// nullptr when no tool has that name.
    [[nodiscard]] const Tool* FindTool(const std::string& name) const;

    /// nullptr when no resource has that URI.
    [[nodiscard]] const Resource* FindResource(const std::string& uri) const;

    /// Wire form of tools/list: [{name, description, inputSchema}, ...]
    [[nodiscard]] nlohmann::json ToolsJson() const;

    /// Wire form of resources/list: [{uri, name, description, mimeType}, ...]
    [[nodiscard]] nlohmann::json ResourcesJson() const;

private:
    std::vector<Tool> tools_;
    std::vector<Resource> resources_;
};

} // namespace snap_mcp
