#include <catch2/catch_test_macros.hpp>

#include <snap_mcp/integration/integration_service.hpp>

#include "mocks/mock_host_services.hpp"

#include <string>
#include <vector>

using namespace snap_mcp;
using namespace snap_mcp::testing;

namespace {

AuthUser SignedInUser() {
    return AuthUser{"uid-42", std::string("alice@example.com"), std::string("Alice"), 900, true};
}

// All four mocks wired up, user signed in, camera permission granted.
struct HostFixture {
    MockCameraService camera;
    MockAuthService auth;
    MockMessagingService messaging;
    MockFriendsService friends;

    HostFixture() { auth.user = SignedInUser(); }

    HostServices All() { return HostServices{&camera, &auth, &messaging, &friends}; }
};

} // anonymous namespace

// ===========================================================================
// CapturePhoto
// ===========================================================================

TEST_CASE("IntegrationService: CapturePhoto reports quality and location", "[integration]") {
    HostFixture host;
    IntegrationService service(host.All());

    auto result = service.CapturePhoto(PhotoQuality::High);
    REQUIRE(result.IsOk());
    CHECK(result.Value().find("Photo captured successfully with high quality") == 0);
    CHECK(result.Value().find("gallery://test.jpg") != std::string::npos);
    REQUIRE(host.camera.captures.size() == 1);
    CHECK(host.camera.captures[0] == PhotoQuality::High);
}

TEST_CASE("IntegrationService: CapturePhoto without camera", "[integration]") {
    HostFixture host;
    auto services = host.All();
    services.camera = nullptr;
    IntegrationService service(services);

    auto result = service.CapturePhoto(PhotoQuality::Medium);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ServiceUnavailable);
    CHECK(result.Error().message == "Camera service not available");
    CHECK(result.Error().operation == "CapturePhoto");
}

TEST_CASE("IntegrationService: CapturePhoto needs granted permission", "[integration]") {
    HostFixture host;
    IntegrationService service(host.All());

    for (auto status : {PermissionStatus::Denied, PermissionStatus::NotDetermined}) {
        host.camera.permission = status;
        auto result = service.CapturePhoto(PhotoQuality::Low);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::PermissionDenied);
    }
    CHECK(host.camera.captures.empty());
}

TEST_CASE("IntegrationService: CapturePhoto passes camera errors through", "[integration]") {
    HostFixture host;
    host.camera.capture_result = Result<std::string, Error>::Err(
        Error{"Capture", "sensor busy", ErrorCategory::ServiceUnavailable, std::nullopt});
    IntegrationService service(host.All());

    auto result = service.CapturePhoto(PhotoQuality::Low);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "sensor busy");
}

// ===========================================================================
// SendSnap
// ===========================================================================

TEST_CASE("IntegrationService: SendSnap delivers to non-empty recipients", "[integration]") {
    HostFixture host;
    IntegrationService service(host.All());

    std::vector<uint8_t> media{1, 2, 3};
    auto result = service.SendSnap({"bob", "", "carol"}, 7, media);
    REQUIRE(result.IsOk());
    CHECK(result.Value() == "Snap sent successfully to 2 recipients with 7s duration");

    REQUIRE(host.messaging.sent.size() == 1);
    const auto& sent = host.messaging.sent[0];
    CHECK(sent.sender_id == "uid-42");
    CHECK(sent.recipients == std::vector<std::string>{"bob", "carol"});
    CHECK(sent.duration_seconds == 7);
    REQUIRE(sent.media.has_value());
    CHECK(*sent.media == media);
}

TEST_CASE("IntegrationService: SendSnap requires a signed-in user", "[integration]") {
    HostFixture host;
    host.auth.user.reset();
    IntegrationService service(host.All());

    auto result = service.SendSnap({"bob"}, 5, std::nullopt);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::AuthenticationRequired);
    CHECK(result.Error().message == "User must be authenticated");
    CHECK(host.messaging.sent.empty());
}

TEST_CASE("IntegrationService: SendSnap without messaging", "[integration]") {
    HostFixture host;
    auto services = host.All();
    services.messaging = nullptr;
    IntegrationService service(services);

    auto result = service.SendSnap({"bob"}, 5, std::nullopt);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::ServiceUnavailable);
}

TEST_CASE("IntegrationService: SendSnap rejects empty recipient lists", "[integration]") {
    HostFixture host;
    IntegrationService service(host.All());

    auto none = service.SendSnap({}, 5, std::nullopt);
    REQUIRE(none.IsErr());
    CHECK(none.Error().category == ErrorCategory::InvalidInput);
    CHECK(none.Error().message == "No valid recipients found");

    auto blanks = service.SendSnap({"", ""}, 5, std::nullopt);
    REQUIRE(blanks.IsErr());
    CHECK(blanks.Error().category == ErrorCategory::InvalidInput);
}

TEST_CASE("IntegrationService: SendSnap duration bounds are 1 to 10", "[integration]") {
    HostFixture host;
    IntegrationService service(host.All());

    CHECK(service.SendSnap({"bob"}, 1, std::nullopt).IsOk());
    CHECK(service.SendSnap({"bob"}, 10, std::nullopt).IsOk());

    for (int duration : {0, 11, -3}) {
        auto result = service.SendSnap({"bob"}, duration, std::nullopt);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Duration must be between 1-10 seconds");
    }
    CHECK(host.messaging.sent.size() == 2);
}

// ===========================================================================
// GetFriends / GetCameraStatus / GetUserProfile
// ===========================================================================

TEST_CASE("IntegrationService: GetFriends delegates to the friends service", "[integration]") {
    HostFixture host;
    host.friends.friends_result = Result<std::vector<Friend>, Error>::Ok(
        {Friend{"u1", "bob", "Bob", 10, {}}});
    IntegrationService service(host.All());

    auto result = service.GetFriends();
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 1);
    CHECK(result.Value()[0].username == "bob");

    auto services = host.All();
    services.friends = nullptr;
    IntegrationService without(services);
    auto missing = without.GetFriends();
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().message == "Friends service not available");
}

TEST_CASE("IntegrationService: GetCameraStatus reflects hardware", "[integration]") {
    HostFixture host;
    host.camera.permission = PermissionStatus::NotDetermined;
    IntegrationService service(host.All());

    auto status = service.GetCameraStatus();
    CHECK(status.available);
    CHECK(status.permission == PermissionStatus::NotDetermined);
    CHECK(status.front_camera);
    CHECK_FALSE(status.back_camera);
    CHECK(status.flash_available);
}

TEST_CASE("IntegrationService: GetCameraStatus without camera is all false", "[integration]") {
    IntegrationService service(HostServices{});

    auto status = service.GetCameraStatus();
    CHECK_FALSE(status.available);
    CHECK(status.permission == PermissionStatus::Denied);
    CHECK_FALSE(status.front_camera);
    CHECK_FALSE(status.back_camera);
    CHECK_FALSE(status.flash_available);
}

TEST_CASE("IntegrationService: GetUserProfile derives username from e-mail", "[integration]") {
    HostFixture host;
    IntegrationService service(host.All());

    auto profile = service.GetUserProfile();
    REQUIRE(profile.has_value());
    CHECK(profile->id == "uid-42");
    CHECK(profile->username == "alice");
    CHECK(profile->display_name == "Alice");
    CHECK(profile->email == "alice@example.com");
    CHECK(profile->snap_score == 900);
    CHECK(profile->verified);
}

TEST_CASE("IntegrationService: GetUserProfile fallbacks", "[integration]") {
    HostFixture host;
    host.auth.user = AuthUser{"uid-7", std::nullopt, std::nullopt, 0, false};
    IntegrationService service(host.All());

    auto profile = service.GetUserProfile();
    REQUIRE(profile.has_value());
    CHECK(profile->username == "user");
    CHECK(profile->display_name == "Snap User");
    CHECK(profile->email.empty());

    host.auth.user.reset();
    CHECK_FALSE(service.GetUserProfile().has_value());
}
