#pragma once

#include <mcp_gateway/core/clock.hpp>
#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/session/tenant_index.hpp>
#include <mcp_gateway/session/transport.hpp>
#include <mcp_gateway/session/transport_registry.hpp>
#include <mcp_gateway/store/session_store.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

struct RecoveryOptions {
    int max_attempts = 3;
    std::chrono::seconds cooldown{300};
    std::chrono::seconds cleanup_interval{3600};
    std::string server_name = "mcp-gateway";
};

enum class RecoveryStage {
    Existing,    // stage 1: a live local transport already existed
    Reattached,  // stage 2: new transport over the existing session
    Rebuilt,     // stage 3: new session and new transport
};

std::string ToString(RecoveryStage stage);

struct RecoveryOutcome {
    RecoveryStage stage = RecoveryStage::Existing;
    std::shared_ptr<ITransport> transport;
};

struct RecoveryAttempt {
    int count = 0;
    TimePoint last_attempt{};
};

struct RecoveryStats {
    std::map<std::string, RecoveryAttempt> attempts;
    int max_attempts = 0;
    std::chrono::seconds cooldown{0};

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// RecoveryOrchestrator — repairs sessions whose transport is not bound in
// this process.
//
// Admission: at most max_attempts per session id within one cooldown
// window. The attempt is recorded before any work is done. Rejection
// happens without touching the store.
//
// Stages run at most once per admission, in order:
//   1. TransportRegistry::Resolve -> live handle ends recovery
//   2. application session exists -> construct transport, bind it
//   3. create the session (recovered = true), then as stage 2
//
// Any failure ends the call; nothing is retried here. Attempt counters
// are process-local.
// ---------------------------------------------------------------------------
class RecoveryOrchestrator {
public:
    RecoveryOrchestrator(SessionStore& store, TenantSessionIndex& index,
                         TransportRegistry& registry,
                         ITransportFactory& factory,
                         const IClock& clock = DefaultClock(),
                         RecoveryOptions options = {});

    // identity_hash selects the tenant partition; empty means shared.
    [[nodiscard]] Result<RecoveryOutcome, Error> Recover(
        std::string_view session_id, std::string_view identity_hash = {});

    // Tenant form; a rebuilt session records owner as its identity.
    [[nodiscard]] Result<RecoveryOutcome, Error> Recover(
        std::string_view session_id, const Identity& owner);

    // Drops counters idle for two cooldown windows. Returns how many.
    std::size_t CleanupOldAttempts();

    [[nodiscard]] RecoveryStats Stats() const;

private:
    // Returns false when the attempt budget is spent.
    bool Admit(const std::string& session_id);

    Result<RecoveryOutcome, Error> Run(const std::string& session_id,
                                       const std::string& identity_hash,
                                       const Identity* owner);
    Result<RecoveryOutcome, Error> Attach(const std::string& session_id,
                                          RecoveryStage stage);
    Result<RecoveryOutcome, Error> Rebuild(const std::string& session_id,
                                           const std::string& identity_hash,
                                           const Identity* owner);

    SessionStore& store_;
    TenantSessionIndex& index_;
    TransportRegistry& registry_;
    ITransportFactory& factory_;
    const IClock& clock_;
    RecoveryOptions options_;

    std::map<std::string, RecoveryAttempt> attempts_;
    TimePoint last_cleanup_;
    mutable std::mutex mutex_;
};

} // namespace mcp_gateway
