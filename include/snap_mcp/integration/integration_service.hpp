#pragma once

#include <snap_mcp/integration/host_services.hpp>
#include <snap_mcp/integration/i_integration_service.hpp>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// IntegrationService - IIntegrationService over the host app's services.
//
// Each operation checks that the service it needs is present and that the
// host state allows the action (camera permission, signed-in user, valid
// recipients/duration) before delegating. Failures come back as Error with
// ServiceUnavailable, PermissionDenied, AuthenticationRequired or
// InvalidInput.
// ---------------------------------------------------------------------------
class IntegrationService : public IIntegrationService {
public:
    static constexpr int kMinSnapDuration = 1;
    static constexpr int kMaxSnapDuration = 10;

    explicit IntegrationService(HostServices services);

    [[nodiscard]] Result<std::string, Error> CapturePhoto(
        PhotoQuality quality) override;

    [[nodiscard]] Result<std::string, Error> SendSnap(
        const std::vector<std::string>& recipients,
        int duration,
        const std::optional<std::vector<uint8_t>>& media) override;

    [[nodiscard]] Result<std::vector<Friend>, Error> GetFriends() override;

    [[nodiscard]] CameraStatus GetCameraStatus() override;

    [[nodiscard]] std::optional<UserProfile> GetUserProfile() override;

private:
    HostServices services_;
};

} // namespace snap_mcp
