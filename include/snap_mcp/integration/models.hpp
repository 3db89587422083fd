#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// PhotoQuality - capture_photo quality setting.
// ---------------------------------------------------------------------------
enum class PhotoQuality {
    Low,
    Medium,
    High,
};

const char* PhotoQualityName(PhotoQuality quality);
std::optional<PhotoQuality> ParsePhotoQuality(std::string_view name);

// ---------------------------------------------------------------------------
// PermissionStatus - camera permission as reported by the host.
// ---------------------------------------------------------------------------
enum class PermissionStatus {
    Granted,
    Denied,
    NotDetermined,
};

const char* PermissionStatusName(PermissionStatus status);

struct Friend {
    std::string id;
    std::string username;
    std::string display_name;
    int snap_score = 0;
    std::chrono::system_clock::time_point last_seen;
};

struct CameraStatus {
    bool available = false;
    PermissionStatus permission = PermissionStatus::Denied;
    bool front_camera = false;
    bool back_camera = false;
    bool flash_available = false;
};

struct UserProfile {
    std::string id;
    std::string username;
    std::string display_name;
    std::string email;
    int snap_score = 0;
    bool verified = false;
};

/// "2024-08-19T20:30:00Z" (UTC, second precision).
std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

// Resource payload shapes served by resources/read.
nlohmann::json ToJson(const Friend& f);
nlohmann::json ToJson(const CameraStatus& status);
nlohmann::json ToJson(const UserProfile& profile);

} // namespace snap_mcp
