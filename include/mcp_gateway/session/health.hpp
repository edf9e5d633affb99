#pragma once

#include <mcp_gateway/session/discovery.hpp>
#include <mcp_gateway/session/recovery.hpp>
#include <mcp_gateway/session/tenant_index.hpp>
#include <mcp_gateway/session/transport_registry.hpp>
#include <mcp_gateway/store/session_store.hpp>

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// HealthSnapshot — read-only diagnostics view. Never consulted by the
// recovery logic.
//
// When the backend is unreachable the counts are zero and backend_error
// carries the reason.
// ---------------------------------------------------------------------------
struct HealthSnapshot {
    bool backend_reachable = false;
    std::string backend_error;
    std::size_t application_sessions = 0;   // shared namespace
    std::size_t transport_sessions = 0;     // durable existence records
    std::size_t local_transports = 0;       // handles in this process
    TenantStats tenants;
    RecoveryStats recovery;
    std::optional<DiscoveryCounters> discovery;

    [[nodiscard]] nlohmann::json ToJson() const;
};

class HealthReporter {
public:
    // discovery may be null when passive discovery is disabled.
    HealthReporter(SessionStore& store, TenantSessionIndex& index,
                   TransportRegistry& registry,
                   const RecoveryOrchestrator& recovery,
                   const SessionDiscovery* discovery = nullptr);

    [[nodiscard]] HealthSnapshot Snapshot();

private:
    SessionStore& store_;
    TenantSessionIndex& index_;
    TransportRegistry& registry_;
    const RecoveryOrchestrator& recovery_;
    const SessionDiscovery* discovery_;
};

} // namespace mcp_gateway
