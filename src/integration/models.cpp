#include <snap_mcp/integration/models.hpp>

#include <ctime>
#include <iomanip>
#include <sstream>

namespace snap_mcp {

const char* PhotoQualityName(PhotoQuality quality) {
    switch (quality) {
        case PhotoQuality::Low:    return "low";
        case PhotoQuality::Medium: return "medium";
        case PhotoQuality::High:   return "high";
    }
    return "medium";
}

std::optional<PhotoQuality> ParsePhotoQuality(std::string_view name) {
    if (name == "low") return PhotoQuality::Low;
    if (name == "medium") return PhotoQuality::Medium;
    if (name == "high") return PhotoQuality::High;
    return std::nullopt;
}

const char* PermissionStatusName(PermissionStatus status) {
    switch (status) {
        case PermissionStatus::Granted:       return "granted";
        case PermissionStatus::Denied:        return "denied";
        case PermissionStatus::NotDetermined: return "notDetermined";
    }
    return "denied";
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json ToJson(const Friend& f) {
    return {
        {"id", f.id},
        {"username", f.username},
        {"displayName", f.display_name},
        {"snapScore", f.snap_score},
        {"lastSeen", FormatTimestamp(f.last_seen)},
    };
}

// Camera status keeps the snake_case keys existing clients already parse.
nlohmann::json ToJson(const CameraStatus& status) {
    return {
        {"available", status.available},
        {"permission", PermissionStatusName(status.permission)},
        {"front_camera", status.front_camera},
        {"back_camera", status.back_camera},
        {"flash_available", status.flash_available},
    };
}

nlohmann::json ToJson(const UserProfile& profile) {
    return {
        {"id", profile.id},
        {"username", profile.username},
        {"displayName", profile.display_name},
        {"email", profile.email},
        {"snapScore", profile.snap_score},
        {"verified", profile.verified},
    };
}

} // namespace snap_mcp
