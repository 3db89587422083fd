#include <snap_mcp/integration/simulated_host.hpp>

#include <chrono>

namespace snap_mcp {

namespace {

Friend MakeFriend(std::string id, std::string username, std::string display_name,
                  int snap_score, std::chrono::seconds seen_ago) {
    return Friend{std::move(id), std::move(username), std::move(display_name),
                  snap_score, std::chrono::system_clock::now() - seen_ago};
}

} // anonymous namespace

SimulatedHost::SimulatedHost()
    : user_(AuthUser{"current_user", std::string("snapuser123@example.com"),
                     std::string("Snap User"), 1250, false}) {
    using std::chrono::seconds;
    friends_.push_back(MakeFriend("user1", "john_doe", "John Doe", 850, seconds(3600)));
    friends_.push_back(MakeFriend("user2", "jane_smith", "Jane Smith", 1500, seconds(900)));
    friends_.push_back(MakeFriend("user3", "mike_wilson", "Mike Wilson", 620, seconds(7200)));
}

HostServices SimulatedHost::Services() {
    HostServices services;
    services.camera = this;
    services.auth = this;
    services.messaging = this;
    services.friends = this;
    return services;
}

PermissionStatus SimulatedHost::Permission() {
    std::lock_guard<std::mutex> lock(mutex_);
    return permission_;
}

CameraHardware SimulatedHost::Hardware() {
    return CameraHardware{true, true, true};
}

Result<std::string, Error> SimulatedHost::Capture(PhotoQuality quality) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto location = "gallery://photo-" + std::to_string(photos_.size() + 1) + "-" +
                    PhotoQualityName(quality) + ".jpg";
    photos_.push_back(location);
    return Result<std::string, Error>::Ok(location);
}

std::optional<AuthUser> SimulatedHost::CurrentUser() {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_;
}

Result<std::string, Error> SimulatedHost::Send(const SnapMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(message);
    return Result<std::string, Error>::Ok("snap-" + std::to_string(sent_.size()));
}

Result<std::vector<Friend>, Error> SimulatedHost::Friends() {
    std::lock_guard<std::mutex> lock(mutex_);
    return Result<std::vector<Friend>, Error>::Ok(friends_);
}

void SimulatedHost::SetPermission(PermissionStatus permission) {
    std::lock_guard<std::mutex> lock(mutex_);
    permission_ = permission;
}

void SimulatedHost::SignOut() {
    std::lock_guard<std::mutex> lock(mutex_);
    user_.reset();
}

void SimulatedHost::SignIn(AuthUser user) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_ = std::move(user);
}

std::vector<SnapMessage> SimulatedHost::SentSnaps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

std::vector<std::string> SimulatedHost::CapturedPhotos() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return photos_;
}

} // namespace snap_mcp
