#pragma once

#include <snap_mcp/core/result.hpp>
#include <snap_mcp/integration/models.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// Host-side services the IntegrationService adapter bridges to.
//
// These mirror the app's camera, auth, messaging and friends subsystems.
// All of them are called from connection threads.
// ---------------------------------------------------------------------------

struct CameraHardware {
    bool front_camera = false;
    bool back_camera = false;
    bool flash_available = false;
};

class ICameraService {
public:
    virtual ~ICameraService() = default;

    [[nodiscard]] virtual PermissionStatus Permission() = 0;
    [[nodiscard]] virtual CameraHardware Hardware() = 0;

    /// Capture and store a photo; returns where it was saved.
    [[nodiscard]] virtual Result<std::string, Error> Capture(PhotoQuality quality) = 0;
};

struct AuthUser {
    std::string uid;
    std::optional<std::string> email;
    std::optional<std::string> display_name;
    int snap_score = 0;
    bool verified = false;
};

class IAuthService {
public:
    virtual ~IAuthService() = default;

    [[nodiscard]] virtual std::optional<AuthUser> CurrentUser() = 0;
};

struct SnapMessage {
    std::string sender_id;
    std::vector<std::string> recipients;
    int duration_seconds = 5;
    std::optional<std::vector<uint8_t>> media;
};

class IMessagingService {
public:
    virtual ~IMessagingService() = default;

    /// Returns the id assigned to the sent snap.
    [[nodiscard]] virtual Result<std::string, Error> Send(const SnapMessage& message) = 0;
};

class IFriendsService {
public:
    virtual ~IFriendsService() = default;

    [[nodiscard]] virtual Result<std::vector<Friend>, Error> Friends() = 0;
};

// Non-owning; any member may be null when the host has not wired it up.
struct HostServices {
    ICameraService* camera = nullptr;
    IAuthService* auth = nullptr;
    IMessagingService* messaging = nullptr;
    IFriendsService* friends = nullptr;
};

} // namespace snap_mcp
