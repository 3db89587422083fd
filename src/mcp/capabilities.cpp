#include <snap_mcp/mcp/capabilities.hpp>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace snap_mcp {

namespace {

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json EnumProp(const std::vector<std::string>& values,
                        const std::string& desc) {
    return {{"type", "string"}, {"enum", values}, {"description", desc}};
}

nlohmann::json IntRangeProp(int minimum, int maximum, const std::string& desc) {
    return {{"type", "integer"},
            {"minimum", minimum},
            {"maximum", maximum},
            {"description", desc}};
}

nlohmann::json StringArrayProp(const std::string& desc) {
    return {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required = nlohmann::json::array()) {
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) {
        schema["required"] = required;
    }
    return schema;
}

} // anonymous namespace

Capabilities::Capabilities(std::vector<Tool> tools, std::vector<Resource> resources)
    : tools_(std::move(tools)), resources_(std::move(resources)) {
    std::unordered_set<std::string> seen;
    for (const auto& tool : tools_) {
        if (!seen.insert(tool.name).second) {
            throw std::invalid_argument("Duplicate tool name: " + tool.name);
        }
    }
    seen.clear();
    for (const auto& resource : resources_) {
        if (!seen.insert(resource.uri).second) {
            throw std::invalid_argument("Duplicate resource URI: " + resource.uri);
        }
    }
}

Capabilities Capabilities::Default() {
    std::vector<Tool> tools = {
        {tool_name::kCapturePhoto,
         "Capture a photo using the device camera",
         MakeSchema({{"quality", EnumProp({"low", "medium", "high"},
                                          "Photo quality setting")}})},
        {tool_name::kSendSnap,
         "Send a snap to friends",
         MakeSchema({{"recipients", StringArrayProp("List of recipient user IDs")},
                     {"duration", IntRangeProp(1, 10, "Snap duration in seconds (1-10)")},
                     {"media", StringProp("Base64-encoded image to attach")}},
                    nlohmann::json::array({"recipients"}))},
        {tool_name::kGetFriends,
         "Get list of user's friends",
         MakeSchema(nlohmann::json::object())},
    };

    std::vector<Resource> resources = {
        {resource_uri::kCameraStatus, "Camera Status",
         "Current camera availability and permissions"},
        {resource_uri::kUserProfile, "User Profile",
         "Current user's profile information"},
        {resource_uri::kFriendsList, "Friends List",
         "List of user's friends"},
    };

    return Capabilities(std::move(tools), std::move(resources));
}

const Tool* Capabilities::FindTool(const std::string& name) const {
    auto it = std::find_if(tools_.begin(), tools_.end(),
                           [&](const Tool& t) { return t.name == name; });
    return it == tools_.end() ? nullptr : &*it;
}

const Resource* Capabilities::FindResource(const std::string& uri) const {
    auto it = std::find_if(resources_.begin(), resources_.end(),
                           [&](const Resource& r) { return r.uri == uri; });
    return it == resources_.end() ? nullptr : &*it;
}

nlohmann::json Capabilities::ToolsJson() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tools_) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return tools;
}

nlohmann::json Capabilities::ResourcesJson() const {
    nlohmann::json resources = nlohmann::json::array();
    for (const auto& resource : resources_) {
        resources.push_back({
            {"uri", resource.uri},
            {"name", resource.name},
            {"description", resource.description},
            {"mimeType", resource.mime_type}
        });
    }
    return resources;
}

} // namespace snap_mcp
