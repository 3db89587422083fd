#include <snap_mcp/integration/integration_service.hpp>

#include <snap_mcp/core/log.hpp>

#include <algorithm>
#include <iterator>

namespace snap_mcp {

namespace {

constexpr const char* kComponent = "integration";

Error MakeIntegrationError(const std::string& operation, const std::string& message,
                           ErrorCategory category) {
    return Error{operation, message, category, std::nullopt};
}

} // anonymous namespace

IntegrationService::IntegrationService(HostServices services)
    : services_(services) {}

// ---------------------------------------------------------------------------
// CapturePhoto
// ---------------------------------------------------------------------------
Result<std::string, Error> IntegrationService::CapturePhoto(PhotoQuality quality) {
    using R = Result<std::string, Error>;

    if (services_.camera == nullptr) {
        return R::Err(MakeIntegrationError("CapturePhoto", "Camera service not available",
                                           ErrorCategory::ServiceUnavailable));
    }

    LogInfo(kComponent, std::string("Capturing photo with quality ") +
                            PhotoQualityName(quality));

    if (services_.camera->Permission() != PermissionStatus::Granted) {
        return R::Err(MakeIntegrationError("CapturePhoto", "Camera permission required",
                                           ErrorCategory::PermissionDenied));
    }

    auto saved = services_.camera->Capture(quality);
    if (saved.IsErr()) {
        return R::Err(saved.Error());
    }

    return R::Ok(std::string("Photo captured successfully with ") +
                 PhotoQualityName(quality) + " quality at " +
                 FormatTimestamp(std::chrono::system_clock::now()) +
                 ". Saved to " + saved.Value() + ".");
}

// ---------------------------------------------------------------------------
// SendSnap
// ---------------------------------------------------------------------------
Result<std::string, Error> IntegrationService::SendSnap(
    const std::vector<std::string>& recipients,
    int duration,
    const std::optional<std::vector<uint8_t>>& media) {
    using R = Result<std::string, Error>;

    if (services_.messaging == nullptr) {
        return R::Err(MakeIntegrationError("SendSnap", "Messaging service not available",
                                           ErrorCategory::ServiceUnavailable));
    }

    std::optional<AuthUser> user;
    if (services_.auth != nullptr) {
        user = services_.auth->CurrentUser();
    }
    if (!user.has_value()) {
        return R::Err(MakeIntegrationError("SendSnap", "User must be authenticated",
                                           ErrorCategory::AuthenticationRequired));
    }

    LogInfo(kComponent, "Sending snap to " + std::to_string(recipients.size()) +
                            " recipients");

    std::vector<std::string> valid;
    std::copy_if(recipients.begin(), recipients.end(), std::back_inserter(valid),
                 [](const std::string& r) { return !r.empty(); });
    if (valid.empty()) {
        return R::Err(MakeIntegrationError("SendSnap", "No valid recipients found",
                                           ErrorCategory::InvalidInput));
    }

    if (duration < kMinSnapDuration || duration > kMaxSnapDuration) {
        return R::Err(MakeIntegrationError("SendSnap",
                                           "Duration must be between 1-10 seconds",
                                           ErrorCategory::InvalidInput));
    }

    SnapMessage message{user->uid, valid, duration, media};
    auto sent = services_.messaging->Send(message);
    if (sent.IsErr()) {
        return R::Err(sent.Error());
    }

    LogDebug(kComponent, "Snap " + sent.Value() + " delivered");
    return R::Ok("Snap sent successfully to " + std::to_string(valid.size()) +
                 " recipients with " + std::to_string(duration) + "s duration");
}

// ---------------------------------------------------------------------------
// GetFriends
// ---------------------------------------------------------------------------
Result<std::vector<Friend>, Error> IntegrationService::GetFriends() {
    if (services_.friends == nullptr) {
        return Result<std::vector<Friend>, Error>::Err(
            MakeIntegrationError("GetFriends", "Friends service not available",
                                 ErrorCategory::ServiceUnavailable));
    }
    LogInfo(kComponent, "Retrieving friends list");
    return services_.friends->Friends();
}

// ---------------------------------------------------------------------------
// GetCameraStatus
// ---------------------------------------------------------------------------
CameraStatus IntegrationService::GetCameraStatus() {
    if (services_.camera == nullptr) {
        return CameraStatus{};
    }

    const auto hardware = services_.camera->Hardware();
    CameraStatus status;
    status.available = true;
    status.permission = services_.camera->Permission();
    status.front_camera = hardware.front_camera;
    status.back_camera = hardware.back_camera;
    status.flash_available = hardware.flash_available;
    return status;
}

// ---------------------------------------------------------------------------
// GetUserProfile
// ---------------------------------------------------------------------------
std::optional<UserProfile> IntegrationService::GetUserProfile() {
    if (services_.auth == nullptr) {
        return std::nullopt;
    }
    auto user = services_.auth->CurrentUser();
    if (!user.has_value()) {
        return std::nullopt;
    }

    UserProfile profile;
    profile.id = user->uid;
    profile.email = user->email.value_or("");
    profile.username = "user";
    if (user->email.has_value()) {
        auto at = user->email->find('@');
        auto local = user->email->substr(0, at);
        if (!local.empty()) {
            profile.username = local;
        }
    }
    profile.display_name = user->display_name.value_or("Snap User");
    profile.snap_score = user->snap_score;
    profile.verified = user->verified;
    return profile;
}

} // namespace snap_mcp
