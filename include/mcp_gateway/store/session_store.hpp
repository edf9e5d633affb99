#pragma once

#include <mcp_gateway/core/clock.hpp>
#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/identity/identity.hpp>
#include <mcp_gateway/store/i_kv_backend.hpp>
#include <mcp_gateway/store/session_records.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// Outcome of a store operation that can legitimately find nothing.
enum class StoreStatus {
    Ok,
    Absent,
    AlreadyHandled,
};

std::string ToString(StoreStatus status);

struct SessionStoreOptions {
    std::string session_prefix = "mcp_session:";
    std::string tenant_session_prefix = "mcp_user_session:";
    std::string transport_prefix = "mcp_transport:";
    std::chrono::seconds default_ttl{3600};
    std::chrono::seconds grace_ttl{300};
};

// ---------------------------------------------------------------------------
// SessionStore — TTL-backed CRUD for session records in the shared backend.
//
// Application session operations take an optional tenant (identity hash).
// Empty selects the shared namespace "mcp_session:<id>"; otherwise the
// record lives at "mcp_user_session:<tenant>:<id>". The two never collide,
// so a caller presenting another tenant's id cannot reach its record.
//
// Every mutating call rewrites the record with the default TTL, except
// Deactivate which applies the grace TTL. Records that fail to decode are
// reported as absent. Backend failures surface as BackendUnavailable.
// ---------------------------------------------------------------------------
class SessionStore {
public:
    explicit SessionStore(IKeyValueBackend& backend,
                          const IClock& clock = DefaultClock(),
                          SessionStoreOptions options = {});

    // -- Application sessions -------------------------------------------------

    // Ok when a fresh record was written; AlreadyHandled when an active
    // record exists (its TTL is refreshed, payload untouched).
    [[nodiscard]] Result<StoreStatus, Error> Create(
        std::string_view id, std::string_view client_id,
        const nlohmann::json& payload, std::string_view tenant = {});

    // Tenant form that also records the owner identity.
    [[nodiscard]] Result<StoreStatus, Error> Create(
        std::string_view id, std::string_view client_id,
        const nlohmann::json& payload, const Identity& owner);

    [[nodiscard]] Result<std::optional<ApplicationSession>, Error> Get(
        std::string_view id, std::string_view tenant = {});

    // Shallow-merges partial into the payload and refreshes last_accessed.
    [[nodiscard]] Result<StoreStatus, Error> Update(
        std::string_view id, const nlohmann::json& partial,
        std::string_view tenant = {});

    [[nodiscard]] Result<StoreStatus, Error> Delete(
        std::string_view id, std::string_view tenant = {});

    [[nodiscard]] Result<StoreStatus, Error> Extend(
        std::string_view id, std::chrono::seconds ttl,
        std::string_view tenant = {});

    // Soft delete: is_active = false, rewritten with the grace TTL.
    [[nodiscard]] Result<StoreStatus, Error> Deactivate(
        std::string_view id, std::string_view tenant = {});

    // Session ids in one namespace, prefix stripped. Best-effort.
    [[nodiscard]] Result<std::vector<std::string>, Error> List(
        std::string_view tenant = {});

    // Every tenant-partitioned session record, for statistics. Keys that
    // expire or fail to decode mid-scan are skipped.
    [[nodiscard]] Result<std::vector<ApplicationSession>, Error>
    ScanTenantSessions();

    // -- Transport existence records -----------------------------------------

    [[nodiscard]] Result<void, Error> PutTransport(const TransportSession& record);
    [[nodiscard]] Result<std::optional<TransportSession>, Error> GetTransport(
        std::string_view id);
    [[nodiscard]] Result<StoreStatus, Error> TouchTransport(std::string_view id);
    [[nodiscard]] Result<StoreStatus, Error> DeleteTransport(std::string_view id);
    [[nodiscard]] Result<std::vector<std::string>, Error> ListTransports();

    // -- Health ----------------------------------------------------------------

    [[nodiscard]] Result<void, Error> Ping();

    [[nodiscard]] const SessionStoreOptions& Options() const noexcept {
        return options_;
    }
    [[nodiscard]] const IClock& GetClock() const noexcept { return clock_; }

private:
    [[nodiscard]] std::string SessionKey(std::string_view id,
                                         std::string_view tenant) const;
    [[nodiscard]] std::string SessionPrefix(std::string_view tenant) const;
    [[nodiscard]] std::string TransportKey(std::string_view id) const;

    Result<std::optional<ApplicationSession>, Error> ReadSession(
        const std::string& key);
    Result<void, Error> WriteSession(const std::string& key,
                                     const ApplicationSession& session,
                                     std::chrono::seconds ttl);
    Result<StoreStatus, Error> CreateAt(const std::string& key,
                                        ApplicationSession fresh);
    Result<std::vector<std::string>, Error> ListStripped(
        const std::string& prefix);

    IKeyValueBackend& backend_;
    const IClock& clock_;
    SessionStoreOptions options_;
};

} // namespace mcp_gateway
