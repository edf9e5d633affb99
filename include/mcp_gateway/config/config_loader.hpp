#pragma once

#include <mcp_gateway/config/app_config.hpp>
#include <mcp_gateway/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

// Flags given on the command line. Unset fields leave the file/default
// value alone.
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> backend_url;
    std::optional<std::string> server_name;
    std::optional<int> workers;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file;
    bool log_json = false;
    bool no_discovery = false;
};

// Built-in defaults; backend.url honours $REDIS_URL.
AppConfig DefaultConfig();

// Parse a YAML config file on top of DefaultConfig().
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Same, from YAML text.
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml);

// Parse CLI flags (subcommand already stripped).
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// cli takes precedence over base.
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli);

// Validate value ranges, backend URL scheme and log level.
Result<void, Error> ValidateConfig(const AppConfig& config);

// DefaultConfig -> YAML (if cli.config_path) -> cli -> ValidateConfig.
Result<AppConfig, Error> ResolveConfig(const CliOverrides& cli);

} // namespace mcp_gateway
