#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/identity/identity_resolver.hpp>
#include <mcp_gateway/session/recovery.hpp>
#include <mcp_gateway/session/tenant_index.hpp>
#include <mcp_gateway/session/transport.hpp>
#include <mcp_gateway/session/transport_registry.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

// Header carrying the session id in both directions.
inline constexpr std::string_view kSessionIdHeader = "mcp-session-id";

struct GatewayOptions {
    std::string server_name = "mcp-gateway";
};

// ---------------------------------------------------------------------------
// SessionContext — what a request is served with once admitted.
//
// session_id is the effective id: it differs from the presented one when
// the reuse policy returned another session of the same identity.
// ---------------------------------------------------------------------------
struct SessionContext {
    std::string session_id;
    Identity identity;
    ApplicationSession session;
    std::shared_ptr<ITransport> transport;
    bool generated_id = false;
    std::optional<RecoveryStage> recovery;
};

// ---------------------------------------------------------------------------
// SessionGateway — request admission in front of the tool dispatcher.
//
//   headers -> IdentityResolver -> TenantSessionIndex::FindOrCreate
//           -> TransportRegistry::Resolve
//           -> (no live transport) new transport for "initialize",
//              RecoveryOrchestrator otherwise
//
// A request without a session id is admitted only for "initialize", which
// gets a freshly generated id. Anything else is rejected with
// SessionNotFound.
// ---------------------------------------------------------------------------
class SessionGateway {
public:
    SessionGateway(const IdentityResolver& resolver, TenantSessionIndex& index,
                   TransportRegistry& registry, RecoveryOrchestrator& recovery,
                   ITransportFactory& factory, GatewayOptions options = {});

    [[nodiscard]] Result<SessionContext, Error> Admit(
        const std::map<std::string, std::string>& headers,
        std::string_view method);

    // Deactivates exactly the presented session and unbinds its transport.
    // Never consults the reuse policy or recovery. Absent when the caller
    // has no active session and no transport under that id.
    [[nodiscard]] Result<StoreStatus, Error> Close(
        const std::map<std::string, std::string>& headers);

    // Case-insensitive lookup of the session id header.
    [[nodiscard]] static std::optional<std::string> PresentedSessionId(
        const std::map<std::string, std::string>& headers);

private:
    Result<std::shared_ptr<ITransport>, Error> OpenTransport(
        const std::string& session_id);

    const IdentityResolver& resolver_;
    TenantSessionIndex& index_;
    TransportRegistry& registry_;
    RecoveryOrchestrator& recovery_;
    ITransportFactory& factory_;
    GatewayOptions options_;
};

// JSON-RPC error code for an admission failure:
//   SessionNotFound -32000, RecoveryExhausted -32001,
//   BackendUnavailable -32002, TransportConstructionFailed -32003,
//   anything else -32603.
int JsonRpcErrorCode(const Error& error);

} // namespace mcp_gateway
