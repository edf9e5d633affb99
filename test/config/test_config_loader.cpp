#include <catch2/catch_test_macros.hpp>

#include <mcp_gateway/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#ifdef _WIN32
#include <stdlib.h>  // _putenv_s
#endif

using namespace mcp_gateway;

namespace {
void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void UnsetEnv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}
} // namespace

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Use __FILE__ to get the absolute path of this test file and derive testdata path.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

// Valid config on the in-process backend, independent of $REDIS_URL.
AppConfig MemoryConfig() {
    AppConfig config;
    config.backend.url = "memory://";
    return config;
}

} // anonymous namespace

// ===========================================================================
// DefaultConfig
// ===========================================================================

TEST_CASE("DefaultConfig: built-in values", "[config][defaults]") {
    UnsetEnv("REDIS_URL");
    auto config = DefaultConfig();
    CHECK(config.backend.url == "redis://localhost:6379");
    CHECK(config.sessions.default_ttl == 3600);
    CHECK(config.sessions.grace_ttl == 300);
    CHECK(config.sessions.reuse_window == 300);
    CHECK(config.recovery.max_attempts == 3);
    CHECK(config.recovery.cooldown == 300);
    CHECK(config.discovery.enabled);
    CHECK(config.discovery.capacity == 10000);
    CHECK(config.server.name == "mcp-gateway");
    CHECK(config.tools.virustotal_api_key_env == "VIRUSTOTAL_API_KEY");
    CHECK(config.tools.database_url_env == "DATABASE_URL");
    CHECK(config.log.level == "info");
    CHECK_FALSE(config.log.file.has_value());
}

TEST_CASE("DefaultConfig: REDIS_URL overrides the backend url", "[config][defaults]") {
    SetEnv("REDIS_URL", "redis://from-env:6379");
    auto config = DefaultConfig();
    CHECK(config.backend.url == "redis://from-env:6379");
    UnsetEnv("REDIS_URL");
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.backend.url == "redis://cache.internal:6380/2");
    CHECK(config.backend.connect_timeout_ms == 2500);
    CHECK(config.sessions.default_ttl == 7200);
    CHECK(config.sessions.grace_ttl == 600);
    CHECK(config.sessions.reuse_window == 120);
    CHECK(config.recovery.max_attempts == 5);
    CHECK(config.recovery.cooldown == 60);
    CHECK(config.recovery.cleanup_interval == 900);
    CHECK_FALSE(config.discovery.enabled);
    CHECK(config.discovery.capacity == 500);
    CHECK(config.server.name == "security-tools");
    CHECK(config.server.workers == 8);
    CHECK(config.tools.virustotal_api_key_env == "VT_KEY");
    CHECK(config.tools.virustotal_base_url == "http://127.0.0.1:9000");
    CHECK(config.tools.database_url_env == "EMPLOYEES_DB");
    CHECK(config.log.level == "debug");
    CHECK(config.log.json);
    REQUIRE(config.log.file.has_value());
    CHECK(*config.log.file == "/tmp/mcp-gateway.log");
}

TEST_CASE("LoadFromYaml: minimal config keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.backend.url == "memory://");
    CHECK(config.sessions.default_ttl == 3600);  // default
    CHECK(config.recovery.max_attempts == 3);    // default
    CHECK(config.server.workers == 4);           // default
}

TEST_CASE("LoadFromYaml: nonexistent file", "[config][yaml]") {
    auto result = LoadFromYaml("/nonexistent/path/config.yaml");
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: wrong value type", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_types.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse YAML") != std::string::npos);
}

TEST_CASE("LoadFromYamlString: top level must be a mapping", "[config][yaml]") {
    CHECK(LoadFromYamlString("- a\n- b\n").IsErr());
    CHECK(LoadFromYamlString("").IsOk());
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no args leaves everything unset", "[config][cli]") {
    const char* argv[] = {"mcp-gateway"};
    auto result = LoadFromCli(1, argv);
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().config_path.has_value());
    CHECK_FALSE(result.Value().backend_url.has_value());
    CHECK_FALSE(result.Value().workers.has_value());
    CHECK_FALSE(result.Value().log_json);
    CHECK_FALSE(result.Value().no_discovery);
}

TEST_CASE("LoadFromCli: all flags", "[config][cli]") {
    const char* argv[] = {
        "mcp-gateway",
        "--config", "/etc/mcp-gateway.yaml",
        "--backend-url", "memory://",
        "--server-name", "edge",
        "--workers", "2",
        "--log-level", "warn",
        "--log-file", "/tmp/gw.log",
        "--log-json",
        "--no-discovery"
    };
    int argc = sizeof(argv) / sizeof(argv[0]);

    auto result = LoadFromCli(argc, argv);
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.config_path == std::string("/etc/mcp-gateway.yaml"));
    CHECK(cli.backend_url == std::string("memory://"));
    CHECK(cli.server_name == std::string("edge"));
    CHECK(cli.workers == 2);
    CHECK(cli.log_level == std::string("warn"));
    CHECK(cli.log_file == std::string("/tmp/gw.log"));
    CHECK(cli.log_json);
    CHECK(cli.no_discovery);
}

TEST_CASE("LoadFromCli: non-numeric workers", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "--workers", "many"};
    auto result = LoadFromCli(3, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromCli: unknown flag", "[config][cli]") {
    const char* argv[] = {"mcp-gateway", "--bogus"};
    auto result = LoadFromCli(2, argv);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("CLI parse error") != std::string::npos);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: CLI overrides YAML values", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    CliOverrides cli;
    cli.backend_url = "memory://";
    cli.workers = 1;
    cli.log_level = "error";
    cli.no_discovery = true;

    auto merged = MergeConfigs(yaml_result.Value(), cli);
    CHECK(merged.backend.url == "memory://");
    CHECK(merged.server.workers == 1);
    CHECK(merged.log.level == "error");
    CHECK_FALSE(merged.discovery.enabled);
    // Untouched YAML values survive.
    CHECK(merged.server.name == "security-tools");
    CHECK(merged.sessions.default_ttl == 7200);
}

TEST_CASE("MergeConfigs: YAML values preserved when CLI not set", "[config][merge]") {
    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());

    auto merged = MergeConfigs(yaml_result.Value(), CliOverrides{});
    CHECK(merged.backend.url == "redis://cache.internal:6380/2");
    CHECK(merged.log.json);
    CHECK_FALSE(merged.discovery.enabled);
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(MemoryConfig()).IsOk());

    auto yaml_result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml_result.IsOk());
    CHECK(ValidateConfig(yaml_result.Value()).IsOk());
}

TEST_CASE("ValidateConfig: unsupported backend scheme", "[config][validate]") {
    auto config = MemoryConfig();
    config.backend.url = "postgres://db";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("backend.url") != std::string::npos);
}

TEST_CASE("ValidateConfig: non-positive durations", "[config][validate]") {
    auto config = MemoryConfig();
    config.sessions.reuse_window = 0;
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("sessions.reuse_window") != std::string::npos);
}

TEST_CASE("ValidateConfig: grace TTL may not exceed the default TTL", "[config][validate]") {
    auto yaml_result = LoadFromYaml(TestDataPath("grace_exceeds_ttl.yaml"));
    REQUIRE(yaml_result.IsOk());
    auto result = ValidateConfig(yaml_result.Value());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("grace_ttl") != std::string::npos);
}

TEST_CASE("ValidateConfig: attempt budget and workers", "[config][validate]") {
    auto config = MemoryConfig();
    config.recovery.max_attempts = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = MemoryConfig();
    config.server.workers = 0;
    CHECK(ValidateConfig(config).IsErr());

    config = MemoryConfig();
    config.discovery.capacity = 0;
    CHECK(ValidateConfig(config).IsErr());
}

TEST_CASE("ValidateConfig: unknown log level", "[config][validate]") {
    auto config = MemoryConfig();
    config.log.level = "chatty";
    auto result = ValidateConfig(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("chatty") != std::string::npos);
}

// ===========================================================================
// ResolveConfig
// ===========================================================================

TEST_CASE("ResolveConfig: file then flags", "[config][resolve]") {
    CliOverrides cli;
    cli.config_path = TestDataPath("minimal_config.yaml");
    cli.server_name = "from-cli";

    auto result = ResolveConfig(cli);
    REQUIRE(result.IsOk());
    CHECK(result.Value().backend.url == "memory://");
    CHECK(result.Value().server.name == "from-cli");
}

TEST_CASE("ResolveConfig: validation failure is reported", "[config][resolve]") {
    CliOverrides cli;
    cli.config_path = TestDataPath("grace_exceeds_ttl.yaml");
    auto result = ResolveConfig(cli);
    REQUIRE(result.IsErr());
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("ResolveConfig: missing file is reported", "[config][resolve]") {
    CliOverrides cli;
    cli.config_path = "/nonexistent/mcp-gateway.yaml";
    CHECK(ResolveConfig(cli).IsErr());
}
