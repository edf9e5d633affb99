#include <mcp_gateway/config/config_loader.hpp>
#include <mcp_gateway/core/log.hpp>
#include <mcp_gateway/core/types.hpp>
#include <mcp_gateway/core/version.hpp>
#include <mcp_gateway/identity/identity_resolver.hpp>
#include <mcp_gateway/mcp/mcp_server.hpp>
#include <mcp_gateway/mcp/tool_handlers.hpp>
#include <mcp_gateway/session/discovery.hpp>
#include <mcp_gateway/session/gateway.hpp>
#include <mcp_gateway/session/health.hpp>
#include <mcp_gateway/session/recovery.hpp>
#include <mcp_gateway/session/tenant_index.hpp>
#include <mcp_gateway/session/transport.hpp>
#include <mcp_gateway/session/transport_registry.hpp>
#include <mcp_gateway/store/memory_backend.hpp>
#include <mcp_gateway/store/redis_backend.hpp>
#include <mcp_gateway/store/session_store.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;

enum class Subcommand { Serve, Health };

struct SubcommandParse {
    Subcommand cmd;
    bool found_subcommand;
};

SubcommandParse ParseSubcommand(int argc, const char* const* argv) {
    if (argc < 2) {
        return {Subcommand::Serve, false};
    }
    std::string_view arg1{argv[1]};
    if (arg1 == "serve") {
        return {Subcommand::Serve, true};
    }
    if (arg1 == "health") {
        return {Subcommand::Health, true};
    }
    // Not a subcommand — treat as flag/arg for the default "serve" command.
    return {Subcommand::Serve, false};
}

// Build an argv without the subcommand token so LoadFromCli sees only flags.
std::vector<const char*> StripSubcommand(int argc, const char* const* argv,
                                         bool has_subcommand) {
    std::vector<const char*> stripped;
    stripped.push_back(argv[0]);
    for (int i = has_subcommand ? 2 : 1; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

bool HandleVersionFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--version") {
            std::cout << "mcp-gateway " << mcp_gateway::kVersion << "\n";
            return true;
        }
    }
    return false;
}

void PrintError(const mcp_gateway::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Log sink writing to a file it owns.
class FileSink : public mcp_gateway::ILogSink {
public:
    FileSink(std::unique_ptr<std::ofstream> file, bool json)
        : file_(std::move(file)) {
        if (json) {
            inner_ = std::make_unique<mcp_gateway::JsonSink>(*file_);
        } else {
            inner_ = std::make_unique<mcp_gateway::ConsoleSink>(*file_);
        }
    }

    void Write(mcp_gateway::LogLevel level, std::string_view component,
               std::string_view message) override {
        inner_->Write(level, component, message);
    }

private:
    std::unique_ptr<std::ofstream> file_;
    std::unique_ptr<mcp_gateway::ILogSink> inner_;
};

mcp_gateway::Result<std::unique_ptr<mcp_gateway::ILogSink>, mcp_gateway::Error>
MakeSink(const mcp_gateway::LogConfig& log) {
    using namespace mcp_gateway;
    using SinkResult = Result<std::unique_ptr<ILogSink>, Error>;

    if (log.file) {
        auto file = std::make_unique<std::ofstream>(*log.file, std::ios::app);
        if (!file->is_open()) {
            return SinkResult::Err(Error{"ConfigLoader", *log.file,
                                         "Cannot open log file " + *log.file,
                                         ErrorCategory::Config});
        }
        return SinkResult::Ok(std::make_unique<FileSink>(std::move(file), log.json));
    }
    if (log.json) {
        return SinkResult::Ok(std::make_unique<JsonSink>(std::cerr));
    }
    return SinkResult::Ok(std::make_unique<ConsoleSink>(std::cerr));
}

mcp_gateway::Result<std::unique_ptr<mcp_gateway::IKeyValueBackend>, mcp_gateway::Error>
MakeBackend(const mcp_gateway::BackendConfig& config) {
    using namespace mcp_gateway;
    using BackendResult = Result<std::unique_ptr<IKeyValueBackend>, Error>;

    auto url = BackendUrl::Create(config.url);
    if (url.IsErr()) {
        return BackendResult::Err(Error{"ConfigLoader", config.url, url.Error(),
                                        ErrorCategory::Config});
    }
    if (url.Value().GetKind() == BackendUrl::Kind::Memory) {
        LogInfo("main", "Using in-process session backend");
        return BackendResult::Ok(std::make_unique<MemoryBackend>());
    }

    RedisBackendOptions options;
    options.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    options.socket_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    return BackendResult::Ok(std::make_unique<RedisBackend>(config.url, options));
}

// ---------------------------------------------------------------------------
// Services — the session subsystem wired from configuration. Members are
// declared in dependency order so destruction runs consumers first.
// ---------------------------------------------------------------------------
struct Services {
    std::unique_ptr<mcp_gateway::IKeyValueBackend> backend;
    std::unique_ptr<mcp_gateway::SessionStore> store;
    std::unique_ptr<mcp_gateway::TenantSessionIndex> index;
    std::unique_ptr<mcp_gateway::TransportRegistry> registry;
    std::unique_ptr<mcp_gateway::StreamTransportFactory> factory;
    std::unique_ptr<mcp_gateway::RecoveryOrchestrator> recovery;
    std::unique_ptr<mcp_gateway::IdentityResolver> resolver;
    std::unique_ptr<mcp_gateway::SessionDiscovery> discovery;
    std::unique_ptr<mcp_gateway::DiscoveryPump> pump;
    std::unique_ptr<mcp_gateway::HealthReporter> reporter;
    std::unique_ptr<mcp_gateway::SessionGateway> gateway;
};

Services BuildServices(const mcp_gateway::AppConfig& config,
                       std::unique_ptr<mcp_gateway::IKeyValueBackend> backend) {
    using namespace mcp_gateway;
    using std::chrono::seconds;

    Services s;
    s.backend = std::move(backend);
    s.resolver = std::make_unique<IdentityResolver>();

    SessionStoreOptions store_options;
    store_options.default_ttl = seconds(config.sessions.default_ttl);
    store_options.grace_ttl = seconds(config.sessions.grace_ttl);
    s.store = std::make_unique<SessionStore>(*s.backend, DefaultClock(), store_options);

    TenantIndexOptions index_options;
    index_options.reuse_window = seconds(config.sessions.reuse_window);
    s.index = std::make_unique<TenantSessionIndex>(*s.store, *s.backend, index_options);

    s.registry = std::make_unique<TransportRegistry>(*s.store);
    s.factory = std::make_unique<StreamTransportFactory>(std::cout);

    RecoveryOptions recovery_options;
    recovery_options.max_attempts = config.recovery.max_attempts;
    recovery_options.cooldown = seconds(config.recovery.cooldown);
    recovery_options.cleanup_interval = seconds(config.recovery.cleanup_interval);
    recovery_options.server_name = config.server.name;
    s.recovery = std::make_unique<RecoveryOrchestrator>(
        *s.store, *s.index, *s.registry, *s.factory, DefaultClock(), recovery_options);

    if (config.discovery.enabled) {
        DiscoveryOptions discovery_options;
        discovery_options.capacity = config.discovery.capacity;
        s.discovery = std::make_unique<SessionDiscovery>(*s.resolver, *s.index,
                                                         *s.registry, discovery_options);
        s.pump = std::make_unique<DiscoveryPump>(*s.discovery);
    }

    s.reporter = std::make_unique<HealthReporter>(*s.store, *s.index, *s.registry,
                                                  *s.recovery, s.discovery.get());

    GatewayOptions gateway_options;
    gateway_options.server_name = config.server.name;
    s.gateway = std::make_unique<SessionGateway>(*s.resolver, *s.index, *s.registry,
                                                 *s.recovery, *s.factory,
                                                 gateway_options);
    return s;
}

int RunHealth(Services& services) {
    auto snapshot = services.reporter->Snapshot();
    std::cout << snapshot.ToJson().dump(2) << "\n";
    if (!snapshot.backend_reachable) {
        return mcp_gateway::Error::BackendUnavailable("Health", "", snapshot.backend_error)
            .ExitCode();
    }
    return kExitSuccess;
}

int RunServe(const mcp_gateway::AppConfig& config, Services& services) {
    using namespace mcp_gateway;

    ToolRegistry tools;
    RegisterCalculatorTools(tools);
    HttpVirusTotalClient virustotal(config.tools.virustotal_base_url);
    RegisterVirusTotalTools(tools, virustotal, config.tools.virustotal_api_key_env,
                            EnvironmentLookup);
    RegisterEmployeeTools(tools, config.tools.database_url_env, EnvironmentLookup);
    RegisterSessionTools(tools, *services.reporter);

    McpServerOptions options;
    options.name = config.server.name;
    options.workers = config.server.workers;
    McpServer server(std::move(tools), *services.gateway, *services.factory, options);
    server.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_gateway;

    // --version: print and exit before any parsing.
    if (HandleVersionFlag(argc, argv)) {
        return kExitSuccess;
    }

    auto [subcommand, has_subcommand] = ParseSubcommand(argc, argv);
    auto stripped = StripSubcommand(argc, argv, has_subcommand);

    // Parse CLI args (handles --help internally via argparse).
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), false);
        return cli_result.Error().ExitCode();
    }
    const auto& cli = cli_result.Value();

    auto resolved = ResolveConfig(cli);
    if (resolved.IsErr()) {
        PrintError(resolved.Error(), cli.log_json);
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    auto sink = MakeSink(config.log);
    if (sink.IsErr()) {
        PrintError(sink.Error(), config.log.json);
        return sink.Error().ExitCode();
    }
    const auto level = ParseLogLevel(config.log.level).value_or(LogLevel::Info);
    InitGlobalLogger(std::move(sink).Value(), level);

    auto backend = MakeBackend(config.backend);
    if (backend.IsErr()) {
        PrintError(backend.Error(), config.log.json);
        return backend.Error().ExitCode();
    }
    auto services = BuildServices(config, std::move(backend).Value());

    // Route session-related diagnostics to passive discovery.
    if (services.pump) {
        auto tapped = MakeSink(config.log);
        if (tapped.IsErr()) {
            PrintError(tapped.Error(), config.log.json);
            return tapped.Error().ExitCode();
        }
        DiscoveryPump* pump = services.pump.get();
        InitGlobalLogger(std::make_unique<DiagnosticTapSink>(
                             std::move(tapped).Value(),
                             [pump](std::string_view line) { pump->Offer(line); }),
                         level);
    }

    int exit_code = kExitSuccess;
    switch (subcommand) {
        case Subcommand::Health:
            exit_code = RunHealth(services);
            break;
        case Subcommand::Serve:
            exit_code = RunServe(config, services);
            break;
    }

    // Detach the tap before the pump goes away.
    if (services.pump) {
        services.pump->Stop();
        auto plain = MakeSink(config.log);
        if (plain.IsOk()) {
            InitGlobalLogger(std::move(plain).Value(), level);
        } else {
            InitGlobalLogger(std::make_unique<ConsoleSink>(std::cerr), level);
        }
    }
    return exit_code;
}
