#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mcp_gateway {

struct BackendConfig {
    std::string url = "redis://localhost:6379";  // or $REDIS_URL, or memory://
    int connect_timeout_ms = 1500;
};

struct SessionConfig {
    int default_ttl = 3600;   // seconds
    int grace_ttl = 300;
    int reuse_window = 300;
};

struct RecoveryConfig {
    int max_attempts = 3;
    int cooldown = 300;            // seconds
    int cleanup_interval = 3600;
};

struct DiscoveryConfig {
    bool enabled = true;
    std::size_t capacity = 10000;
};

struct ServerConfig {
    std::string name = "mcp-gateway";
    int workers = 4;
};

struct ToolsConfig {
    std::string virustotal_api_key_env = "VIRUSTOTAL_API_KEY";
    std::string virustotal_base_url = "https://www.virustotal.com";
    std::string database_url_env = "DATABASE_URL";
};

struct LogConfig {
    std::string level = "info";
    bool json = false;
    std::optional<std::string> file;
};

struct AppConfig {
    BackendConfig backend;
    SessionConfig sessions;
    RecoveryConfig recovery;
    DiscoveryConfig discovery;
    ServerConfig server;
    ToolsConfig tools;
    LogConfig log;
};

} // namespace mcp_gateway
