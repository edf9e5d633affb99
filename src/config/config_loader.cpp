#include <mcp_gateway/config/config_loader.hpp>

#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/types.hpp>
#include <mcp_gateway/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <functional>
#include <utility>

namespace mcp_gateway {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, ErrorCategory::Config};
}

template <typename T>
void ReadScalar(const YAML::Node& section, const char* key, T& out) {
    if (section && section[key]) {
        out = section[key].as<T>();
    }
}

// Apply every recognized key of root onto config. Throws YAML::Exception
// on type mismatches; the caller converts.
void ApplyYaml(const YAML::Node& root, AppConfig& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw YAML::Exception(root.Mark(), "top level must be a mapping");
    }

    // -- Backend --
    const auto backend = root["backend"];
    ReadScalar(backend, "url", config.backend.url);
    ReadScalar(backend, "connect_timeout_ms", config.backend.connect_timeout_ms);

    // -- Sessions --
    const auto sessions = root["sessions"];
    ReadScalar(sessions, "default_ttl", config.sessions.default_ttl);
    ReadScalar(sessions, "grace_ttl", config.sessions.grace_ttl);
    ReadScalar(sessions, "reuse_window", config.sessions.reuse_window);

    // -- Recovery --
    const auto recovery = root["recovery"];
    ReadScalar(recovery, "max_attempts", config.recovery.max_attempts);
    ReadScalar(recovery, "cooldown", config.recovery.cooldown);
    ReadScalar(recovery, "cleanup_interval", config.recovery.cleanup_interval);

    // -- Discovery --
    const auto discovery = root["discovery"];
    ReadScalar(discovery, "enabled", config.discovery.enabled);
    ReadScalar(discovery, "capacity", config.discovery.capacity);

    // -- Server --
    const auto server = root["server"];
    ReadScalar(server, "name", config.server.name);
    ReadScalar(server, "workers", config.server.workers);

    // -- Tools --
    const auto tools = root["tools"];
    ReadScalar(tools, "virustotal_api_key_env", config.tools.virustotal_api_key_env);
    ReadScalar(tools, "virustotal_base_url", config.tools.virustotal_base_url);
    ReadScalar(tools, "database_url_env", config.tools.database_url_env);

    // -- Log --
    const auto log = root["log"];
    ReadScalar(log, "level", config.log.level);
    ReadScalar(log, "json", config.log.json);
    if (log && log["file"]) {
        config.log.file = log["file"].as<std::string>();
    }
}

Result<AppConfig, Error> ParseYaml(const std::function<YAML::Node()>& load,
                                   const std::string& origin) {
    AppConfig config = DefaultConfig();
    try {
        ApplyYaml(load(), config);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML " + origin + ": " + e.what()));
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

Result<void, Error> RequirePositive(int value, const char* name) {
    if (value <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            std::string(name) + " must be positive, got " + std::to_string(value)));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DefaultConfig
// ---------------------------------------------------------------------------
AppConfig DefaultConfig() {
    AppConfig config;
    if (const char* url = std::getenv("REDIS_URL"); url != nullptr && *url != '\0') {
        config.backend.url = url;
    }
    return config;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    return ParseYaml([&path] { return YAML::LoadFile(path); }, "file " + path);
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml) {
    const std::string text(yaml);
    return ParseYaml([&text] { return YAML::Load(text); }, "text");
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-gateway", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--backend-url")
        .help("Session backend URL (redis://host:port, memory://)");
    program.add_argument("--server-name")
        .help("Server name recorded on transport sessions");
    program.add_argument("--workers")
        .help("Request worker threads")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-file")
        .help("Append log lines to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Emit log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-discovery")
        .help("Disable passive session discovery from diagnostics")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOverrides cli;
    cli.config_path = program.present("--config");
    cli.backend_url = program.present("--backend-url");
    cli.server_name = program.present("--server-name");
    cli.workers = program.present<int>("--workers");
    cli.log_level = program.present("--log-level");
    cli.log_file = program.present("--log-file");
    cli.log_json = program.get<bool>("--log-json");
    cli.no_discovery = program.get<bool>("--no-discovery");

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli) {
    AppConfig merged = base;

    if (cli.backend_url) {
        merged.backend.url = *cli.backend_url;
    }
    if (cli.server_name) {
        merged.server.name = *cli.server_name;
    }
    if (cli.workers) {
        merged.server.workers = *cli.workers;
    }
    if (cli.log_level) {
        merged.log.level = *cli.log_level;
    }
    if (cli.log_file) {
        merged.log.file = cli.log_file;
    }
    if (cli.log_json) {
        merged.log.json = true;
    }
    if (cli.no_discovery) {
        merged.discovery.enabled = false;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto url = BackendUrl::Create(config.backend.url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid backend.url: " + url.Error()));
    }

    const std::pair<int, const char*> positives[] = {
        {config.backend.connect_timeout_ms, "backend.connect_timeout_ms"},
        {config.sessions.default_ttl, "sessions.default_ttl"},
        {config.sessions.grace_ttl, "sessions.grace_ttl"},
        {config.sessions.reuse_window, "sessions.reuse_window"},
        {config.recovery.cooldown, "recovery.cooldown"},
        {config.recovery.cleanup_interval, "recovery.cleanup_interval"},
    };
    for (const auto& [value, name] : positives) {
        auto checked = RequirePositive(value, name);
        if (checked.IsErr()) {
            return checked;
        }
    }

    if (config.sessions.grace_ttl > config.sessions.default_ttl) {
        return Result<void, Error>::Err(MakeConfigError(
            "sessions.grace_ttl (" + std::to_string(config.sessions.grace_ttl) +
            ") must not exceed sessions.default_ttl (" +
            std::to_string(config.sessions.default_ttl) + ")"));
    }
    if (config.recovery.max_attempts < 1) {
        return Result<void, Error>::Err(MakeConfigError(
            "recovery.max_attempts must be at least 1, got " +
            std::to_string(config.recovery.max_attempts)));
    }
    if (config.server.workers < 1) {
        return Result<void, Error>::Err(MakeConfigError(
            "server.workers must be at least 1, got " +
            std::to_string(config.server.workers)));
    }
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("server.name must not be empty"));
    }
    if (config.discovery.capacity == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("discovery.capacity must be at least 1"));
    }
    if (!ParseLogLevel(config.log.level)) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log.level: " + config.log.level));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliOverrides& cli) {
    AppConfig base = DefaultConfig();
    if (cli.config_path) {
        auto loaded = LoadFromYaml(*cli.config_path);
        if (loaded.IsErr()) {
            return loaded;
        }
        base = std::move(loaded).Value();
    }

    auto merged = MergeConfigs(base, cli);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(merged));
}

} // namespace mcp_gateway
