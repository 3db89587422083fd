#pragma once

#include <snap_mcp/integration/host_services.hpp>

#include <optional>
#include <string>
#include <vector>

namespace snap_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// Hand-written host service mocks for IntegrationService tests. Each one
// returns its public canned value and records what it was asked to do.
// ---------------------------------------------------------------------------

class MockCameraService : public ICameraService {
public:
    PermissionStatus permission = PermissionStatus::Granted;
    CameraHardware hardware{true, false, true};
    Result<std::string, Error> capture_result =
        Result<std::string, Error>::Ok("gallery://test.jpg");

    std::vector<PhotoQuality> captures;

    PermissionStatus Permission() override { return permission; }
    CameraHardware Hardware() override { return hardware; }
    Result<std::string, Error> Capture(PhotoQuality quality) override {
        captures.push_back(quality);
        return capture_result;
    }
};

class MockAuthService : public IAuthService {
public:
    std::optional<AuthUser> user;

    std::optional<AuthUser> CurrentUser() override { return user; }
};

class MockMessagingService : public IMessagingService {
public:
    Result<std::string, Error> send_result = Result<std::string, Error>::Ok("snap-1");

    std::vector<SnapMessage> sent;

    Result<std::string, Error> Send(const SnapMessage& message) override {
        sent.push_back(message);
        return send_result;
    }
};

class MockFriendsService : public IFriendsService {
public:
    Result<std::vector<Friend>, Error> friends_result =
        Result<std::vector<Friend>, Error>::Ok(std::vector<Friend>{});

    Result<std::vector<Friend>, Error> Friends() override { return friends_result; }
};

} // namespace testing
} // namespace snap_mcp
