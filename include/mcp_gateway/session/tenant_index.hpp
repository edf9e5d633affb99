#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/identity/identity.hpp>
#include <mcp_gateway/store/i_kv_backend.hpp>
#include <mcp_gateway/store/session_store.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

struct TenantIndexOptions {
    std::string index_prefix = "mcp_user_index:";
    std::chrono::seconds reuse_window{300};
};

// ---------------------------------------------------------------------------
// TenantStats — aggregate view over all tenant-partitioned sessions.
// ---------------------------------------------------------------------------
struct TenantStats {
    std::size_t total_sessions = 0;
    std::size_t total_users = 0;
    std::size_t active_sessions = 0;
    std::map<std::string, std::size_t> user_type_distribution;

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// TenantSessionIndex — per-identity session partitions and the reuse policy.
//
// Each identity hash owns a set "mcp_user_index:<hash>" of session ids. The
// set is TTL-refreshed whenever a session under it is touched. Index
// entries can outlive their session records; readers skip them.
//
// Session record writes and index writes are separate backend calls and
// are not atomic as a pair.
// ---------------------------------------------------------------------------
class TenantSessionIndex {
public:
    TenantSessionIndex(SessionStore& store, IKeyValueBackend& backend,
                       TenantIndexOptions options = {});

    // a. (session_id, identity) active  -> refresh and return it
    // b. identity has an active session accessed within the reuse window
    //    -> return the most recently accessed one (ties: smaller id)
    // c. otherwise create a new session under (session_id, identity)
    // Backend failures are returned; creation needs a fresh view.
    [[nodiscard]] Result<ApplicationSession, Error> FindOrCreate(
        std::string_view session_id, const Identity& identity,
        const nlohmann::json& request_payload);

    [[nodiscard]] Result<std::optional<ApplicationSession>, Error> Get(
        std::string_view session_id, const Identity& identity);

    // Active sessions under the identity; dangling or inactive ids skipped.
    [[nodiscard]] Result<std::vector<ApplicationSession>, Error> ActiveSessions(
        const Identity& identity);

    [[nodiscard]] Result<StoreStatus, Error> Deactivate(
        std::string_view session_id, const Identity& identity);

    // Adds session_id to the identity's index and refreshes the index TTL.
    [[nodiscard]] Result<void, Error> Register(std::string_view identity_hash,
                                               std::string_view session_id);

    [[nodiscard]] Result<TenantStats, Error> Stats();

    [[nodiscard]] const TenantIndexOptions& Options() const noexcept {
        return options_;
    }

private:
    [[nodiscard]] std::string IndexKey(std::string_view identity_hash) const;
    [[nodiscard]] static std::string ClientIdFor(const Identity& identity,
                                                 const std::string& hash);

    SessionStore& store_;
    IKeyValueBackend& backend_;
    TenantIndexOptions options_;
};

} // namespace mcp_gateway
