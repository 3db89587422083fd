#pragma once

#include <snap_mcp/integration/host_services.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// SimulatedHost - in-memory camera, auth, messaging and friends services.
//
// Used by the snap-mcp executable when no app is attached, so clients can
// exercise every tool and resource. Starts signed in as "snapuser123" with
// camera permission granted and three friends. Thread-safe.
// ---------------------------------------------------------------------------
class SimulatedHost : public ICameraService,
                      public IAuthService,
                      public IMessagingService,
                      public IFriendsService {
public:
    SimulatedHost();

    /// Pointers into this object for IntegrationService.
    [[nodiscard]] HostServices Services();

    // -- ICameraService -----------------------------------------------------
    [[nodiscard]] PermissionStatus Permission() override;
    [[nodiscard]] CameraHardware Hardware() override;
    [[nodiscard]] Result<std::string, Error> Capture(PhotoQuality quality) override;

    // -- IAuthService -------------------------------------------------------
    [[nodiscard]] std::optional<AuthUser> CurrentUser() override;

    // -- IMessagingService --------------------------------------------------
    [[nodiscard]] Result<std::string, Error> Send(const SnapMessage& message) override;

    // -- IFriendsService ----------------------------------------------------
    [[nodiscard]] Result<std::vector<Friend>, Error> Friends() override;

    // -- Host state controls ------------------------------------------------
    void SetPermission(PermissionStatus permission);
    void SignOut();
    void SignIn(AuthUser user);

    [[nodiscard]] std::vector<SnapMessage> SentSnaps() const;
    [[nodiscard]] std::vector<std::string> CapturedPhotos() const;

private:
    mutable std::mutex mutex_;
    PermissionStatus permission_ = PermissionStatus::Granted;
    std::optional<AuthUser> user_;
    std::vector<Friend> friends_;
    std::vector<SnapMessage> sent_;
    std::vector<std::string> photos_;
};

} // namespace snap_mcp
