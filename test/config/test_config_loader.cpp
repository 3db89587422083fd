#include <catch2/catch_test_macros.hpp>

#include <snap_mcp/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace snap_mcp;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive testdata from this file's path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);            // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));   // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "snap-mcp");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "localhost");
    CHECK(config.server.port == 9100);
    CHECK(config.server.backlog == 32);
    REQUIRE(config.log_level.has_value());
    CHECK(*config.log_level == "debug");
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/tmp/snap-mcp.log");
    CHECK(config.json_log);
    REQUIRE(config.color.has_value());
    CHECK_FALSE(*config.color);
}

TEST_CASE("LoadFromYaml: missing keys keep defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 8095);
    CHECK(config.server.backlog == 16);
    CHECK_FALSE(config.log_level.has_value());
    CHECK_FALSE(config.json_log);
    CHECK_FALSE(config.color.has_value());
}

TEST_CASE("LoadFromYaml: nonexistent file is a Config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadFromYaml: malformed YAML is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYaml: out-of-range port is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_port_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("server.port") != std::string::npos);
}

TEST_CASE("LoadFromYaml: non-numeric port is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("wrong_type_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no flags gives defaults", "[config][cli]") {
    auto result = ParseCli({});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.host == "127.0.0.1");
    CHECK(config.server.port == 8090);
    CHECK(config.verbosity == 0);
    CHECK_FALSE(config.config_file.has_value());
}

TEST_CASE("LoadFromCli: server and logging flags", "[config][cli]") {
    auto result = ParseCli({"--host", "localhost", "--port", "0", "--backlog", "4",
                            "--log-level", "error", "--log-file", "out.log",
                            "--json-log", "--no-color", "-c", "snap.yaml"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.server.host == "localhost");
    CHECK(config.server.port == 0);
    CHECK(config.server.backlog == 4);
    CHECK(*config.log_level == "error");
    CHECK(*config.log_file == "out.log");
    CHECK(config.json_log);
    REQUIRE(config.color.has_value());
    CHECK_FALSE(*config.color);
    CHECK(*config.config_file == "snap.yaml");
}

TEST_CASE("LoadFromCli: -v and -vv set verbosity", "[config][cli]") {
    auto info = ParseCli({"-v"});
    REQUIRE(info.IsOk());
    CHECK(info.Value().verbosity == 1);
    CHECK(EffectiveLogLevel(info.Value()) == LogLevel::Info);

    auto debug = ParseCli({"-vv"});
    REQUIRE(debug.IsOk());
    CHECK(debug.Value().verbosity == 2);
    CHECK(EffectiveLogLevel(debug.Value()) == LogLevel::Debug);
}

TEST_CASE("LoadFromCli: unknown flag is a Config error", "[config][cli]") {
    auto result = ParseCli({"--bogus"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: port out of range is rejected", "[config][cli]") {
    auto result = ParseCli({"--port", "65536"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("--port") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI values override the file", "[config][merge]") {
    AppConfig file;
    file.server.host = "localhost";
    file.server.port = 9100;
    file.log_level = "debug";
    file.color = true;

    AppConfig cli;
    cli.server.port = 9200;
    cli.server_set.port = true;
    cli.color = false;

    auto merged = MergeConfigs(file, cli);
    CHECK(merged.server.host == "localhost");
    CHECK(merged.server.port == 9200);
    CHECK(*merged.log_level == "debug");
    CHECK_FALSE(*merged.color);
}

TEST_CASE("MergeConfigs: default CLI values do not clobber the file", "[config][merge]") {
    AppConfig file;
    file.server.port = 9100;
    file.server.backlog = 64;
    file.json_log = true;

    auto merged = MergeConfigs(file, AppConfig{});
    CHECK(merged.server.port == 9100);
    CHECK(merged.server.backlog == 64);
    CHECK(merged.json_log);
}

TEST_CASE("MergeConfigs: explicit CLI port equal to the default still wins", "[config][merge]") {
    auto file = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(file.IsOk());
    REQUIRE(file.Value().server.port == 9100);

    auto cli = ParseCli({"--port", "8090", "--host", "127.0.0.1"});
    REQUIRE(cli.IsOk());
    CHECK(cli.Value().server_set.port);
    CHECK(cli.Value().server_set.host);
    CHECK_FALSE(cli.Value().server_set.backlog);

    auto merged = MergeConfigs(file.Value(), cli.Value());
    CHECK(merged.server.port == 8090);
    CHECK(merged.server.host == "127.0.0.1");
    CHECK(merged.server.backlog == 32);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: defaults are valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}).IsOk());

    AppConfig localhost;
    localhost.server.host = "localhost";
    CHECK(ValidateConfig(localhost).IsOk());
}

TEST_CASE("ValidateConfig: non-loopback host is rejected", "[config][validate]") {
    AppConfig config;
    config.server.host = "0.0.0.0";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("0.0.0.0") != std::string::npos);
}

TEST_CASE("ValidateConfig: backlog must be positive", "[config][validate]") {
    AppConfig config;
    config.server.backlog = 0;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: unknown log level is rejected", "[config][validate]") {
    AppConfig config;
    config.log_level = "chatty";
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("EffectiveLogLevel: log_level applies without -v", "[config]") {
    AppConfig config;
    CHECK(EffectiveLogLevel(config) == LogLevel::Warn);
    config.log_level = "info";
    CHECK(EffectiveLogLevel(config) == LogLevel::Info);
    config.verbosity = 2;
    CHECK(EffectiveLogLevel(config) == LogLevel::Debug);
}
