#pragma once

#include <snap_mcp/core/result.hpp>
#include <snap_mcp/integration/models.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snap_mcp {

// ---------------------------------------------------------------------------
// IIntegrationService - the only way the dispatcher reaches the host app.
//
// The dispatcher depends on this interface rather than on camera, messaging
// or friends code directly, which lets tests run it against MockIntegration.
// Implementations are called concurrently from connection threads and must
// be thread-safe.
//
// Fallible methods return Result<T, Error>; throwing is tolerated (the
// dispatcher converts exceptions) but not expected.
// ---------------------------------------------------------------------------
class IIntegrationService {
public:
    virtual ~IIntegrationService() = default;

    IIntegrationService(const IIntegrationService&) = delete;
    IIntegrationService& operator=(const IIntegrationService&) = delete;
    IIntegrationService(IIntegrationService&&) = delete;
    IIntegrationService& operator=(IIntegrationService&&) = delete;

    /// Returns a human-readable confirmation.
    [[nodiscard]] virtual Result<std::string, Error> CapturePhoto(
        PhotoQuality quality) = 0;

    /// duration is in seconds. Returns a human-readable confirmation.
    [[nodiscard]] virtual Result<std::string, Error> SendSnap(
        const std::vector<std::string>& recipients,
        int duration,
        const std::optional<std::vector<uint8_t>>& media) = 0;

    [[nodiscard]] virtual Result<std::vector<Friend>, Error> GetFriends() = 0;

    [[nodiscard]] virtual CameraStatus GetCameraStatus() = 0;

    /// Empty when nobody is signed in.
    [[nodiscard]] virtual std::optional<UserProfile> GetUserProfile() = 0;

protected:
    IIntegrationService() = default;
};

} // namespace snap_mcp
