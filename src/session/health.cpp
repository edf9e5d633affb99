#include <mcp_gateway/session/health.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

nlohmann::json HealthSnapshot::ToJson() const {
    nlohmann::json j = {
        {"status", backend_reachable ? "healthy" : "degraded"},
        {"backend", {
            {"reachable", backend_reachable},
        }},
        {"application_sessions", application_sessions},
        {"transport_sessions", transport_sessions},
        {"local_transports", local_transports},
        {"multi_user", tenants.ToJson()},
        {"recovery", recovery.ToJson()},
    };
    if (!backend_error.empty()) {
        j["backend"]["error"] = backend_error;
    }
    if (discovery) {
        j["discovery"] = discovery->ToJson();
    }
    return j;
}

HealthReporter::HealthReporter(SessionStore& store, TenantSessionIndex& index,
                               TransportRegistry& registry,
                               const RecoveryOrchestrator& recovery,
                               const SessionDiscovery* discovery)
    : store_(store),
      index_(index),
      registry_(registry),
      recovery_(recovery),
      discovery_(discovery) {}

HealthSnapshot HealthReporter::Snapshot() {
    HealthSnapshot snapshot;
    snapshot.local_transports = registry_.LocalCount();
    snapshot.recovery = recovery_.Stats();
    if (discovery_) {
        snapshot.discovery = discovery_->Counters();
    }

    auto ping = store_.Ping();
    if (ping.IsErr()) {
        snapshot.backend_error = ping.Error().message;
        LogWarn("health", "Session backend unreachable: " + snapshot.backend_error);
        return snapshot;
    }
    snapshot.backend_reachable = true;

    // Counts are informative; a failure midway leaves them at zero.
    if (auto ids = store_.List(); ids.IsOk()) {
        snapshot.application_sessions = ids.Value().size();
    } else {
        snapshot.backend_error = ids.Error().message;
    }
    if (auto ids = registry_.List(); ids.IsOk()) {
        snapshot.transport_sessions = ids.Value().size();
    } else {
        snapshot.backend_error = ids.Error().message;
    }
    if (auto stats = index_.Stats(); stats.IsOk()) {
        snapshot.tenants = stats.Value();
    } else {
        snapshot.backend_error = stats.Error().message;
    }
    return snapshot;
}

} // namespace mcp_gateway
