#include <mcp_gateway/session/tenant_index.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "tenant";

template <typename T>
Result<T, Error> Forward(const Error& error) {
    return Result<T, Error>::Err(error);
}

// Strictly newer wins; equal timestamps fall back to the smaller id.
bool MoreRecent(const ApplicationSession& a, const ApplicationSession& b) {
    if (a.last_accessed != b.last_accessed) {
        return a.last_accessed > b.last_accessed;
    }
    return a.session_id < b.session_id;
}

} // anonymous namespace

nlohmann::json TenantStats::ToJson() const {
    return {
        {"total_session_keys", total_sessions},
        {"total_user_indexes", total_users},
        {"active_sessions", active_sessions},
        {"user_type_distribution", user_type_distribution},
    };
}

TenantSessionIndex::TenantSessionIndex(SessionStore& store,
                                       IKeyValueBackend& backend,
                                       TenantIndexOptions options)
    : store_(store), backend_(backend), options_(std::move(options)) {}

std::string TenantSessionIndex::IndexKey(std::string_view identity_hash) const {
    return options_.index_prefix + std::string(identity_hash);
}

std::string TenantSessionIndex::ClientIdFor(const Identity& identity,
                                            const std::string& hash) {
    return "mcp_client_" + ToString(identity.user_type) + "_" + hash.substr(0, 8);
}

// ---------------------------------------------------------------------------
// FindOrCreate
// ---------------------------------------------------------------------------
Result<ApplicationSession, Error> TenantSessionIndex::FindOrCreate(
    std::string_view session_id, const Identity& identity,
    const nlohmann::json& request_payload) {
    const auto hash = IdentityHash(identity);

    // a. Direct hit on (session_id, identity).
    auto direct = store_.Get(session_id, hash);
    if (direct.IsErr()) {
        return Forward<ApplicationSession>(direct.Error());
    }
    if (direct.Value() && direct.Value()->is_active) {
        auto updated = store_.Update(session_id, request_payload, hash);
        if (updated.IsErr()) {
            return Forward<ApplicationSession>(updated.Error());
        }
        auto registered = Register(hash, session_id);
        if (registered.IsErr()) {
            return Forward<ApplicationSession>(registered.Error());
        }
        auto refreshed = store_.Get(session_id, hash);
        if (refreshed.IsErr()) {
            return Forward<ApplicationSession>(refreshed.Error());
        }
        if (refreshed.Value()) {
            return Result<ApplicationSession, Error>::Ok(*refreshed.Value());
        }
        // Expired between the two reads; fall through to reuse or create.
    }

    // b. Reuse the identity's most recently accessed session.
    auto active = ActiveSessions(identity);
    if (active.IsErr()) {
        return Forward<ApplicationSession>(active.Error());
    }
    const auto now = store_.GetClock().Now();
    const ApplicationSession* best = nullptr;
    for (const auto& candidate : active.Value()) {
        if (now - candidate.last_accessed >= options_.reuse_window) {
            continue;
        }
        if (!best || MoreRecent(candidate, *best)) {
            best = &candidate;
        }
    }
    if (best) {
        auto touched = store_.Update(best->session_id, nlohmann::json::object(), hash);
        if (touched.IsErr()) {
            return Forward<ApplicationSession>(touched.Error());
        }
        if (touched.Value() == StoreStatus::Ok) {
            auto registered = Register(hash, best->session_id);
            if (registered.IsErr()) {
                return Forward<ApplicationSession>(registered.Error());
            }
            LogInfo(kComponent, "Reusing recent session " + best->session_id +
                                    " for user " + identity.user_id);
            auto reused = *best;
            reused.last_accessed = now;
            return Result<ApplicationSession, Error>::Ok(std::move(reused));
        }
    }

    // c. Create under (session_id, identity).
    auto created = store_.Create(session_id, ClientIdFor(identity, hash),
                                 request_payload, identity);
    if (created.IsErr()) {
        return Forward<ApplicationSession>(created.Error());
    }
    auto registered = Register(hash, session_id);
    if (registered.IsErr()) {
        return Forward<ApplicationSession>(registered.Error());
    }
    auto fresh = store_.Get(session_id, hash);
    if (fresh.IsErr()) {
        return Forward<ApplicationSession>(fresh.Error());
    }
    if (!fresh.Value()) {
        return Result<ApplicationSession, Error>::Err(Error{
            "FindOrCreate", std::string(session_id),
            "Session record vanished immediately after creation",
            ErrorCategory::Internal});
    }
    LogInfo(kComponent, "Created session " + std::string(session_id) +
                            " for user " + identity.user_id);
    return Result<ApplicationSession, Error>::Ok(*fresh.Value());
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------
Result<std::optional<ApplicationSession>, Error> TenantSessionIndex::Get(
    std::string_view session_id, const Identity& identity) {
    return store_.Get(session_id, IdentityHash(identity));
}

Result<std::vector<ApplicationSession>, Error> TenantSessionIndex::ActiveSessions(
    const Identity& identity) {
    const auto hash = IdentityHash(identity);
    const auto index_key = IndexKey(hash);
    auto members = backend_.SMembers(index_key);
    if (members.IsErr()) {
        return Forward<std::vector<ApplicationSession>>(members.Error());
    }

    std::vector<ApplicationSession> sessions;
    for (const auto& id : members.Value()) {
        auto session = store_.Get(id, hash);
        if (session.IsErr()) {
            return Forward<std::vector<ApplicationSession>>(session.Error());
        }
        if (!session.Value()) {
            // Dangling index entry; the record expired first.
            auto pruned = backend_.SRem(index_key, id);
            if (pruned.IsErr()) {
                LogDebug(kComponent, "Could not prune dangling index entry " +
                                         id + ": " + pruned.Error().message);
            }
            continue;
        }
        if (session.Value()->is_active) {
            sessions.push_back(*session.Value());
        }
    }
    return Result<std::vector<ApplicationSession>, Error>::Ok(std::move(sessions));
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------
Result<StoreStatus, Error> TenantSessionIndex::Deactivate(
    std::string_view session_id, const Identity& identity) {
    const auto hash = IdentityHash(identity);
    auto status = store_.Deactivate(session_id, hash);
    if (status.IsErr()) {
        return status;
    }
    auto removed = backend_.SRem(IndexKey(hash), session_id);
    if (removed.IsErr()) {
        return Forward<StoreStatus>(removed.Error());
    }
    return status;
}

Result<void, Error> TenantSessionIndex::Register(std::string_view identity_hash,
                                                 std::string_view session_id) {
    const auto key = IndexKey(identity_hash);
    auto added = backend_.SAdd(key, session_id);
    if (added.IsErr()) {
        return added;
    }
    auto expired = backend_.Expire(key, store_.Options().default_ttl);
    if (expired.IsErr()) {
        return Result<void, Error>::Err(expired.Error());
    }
    return Result<void, Error>::Ok();
}

Result<TenantStats, Error> TenantSessionIndex::Stats() {
    auto sessions = store_.ScanTenantSessions();
    if (sessions.IsErr()) {
        return Forward<TenantStats>(sessions.Error());
    }
    auto indexes = backend_.KeysWithPrefix(options_.index_prefix);
    if (indexes.IsErr()) {
        return Forward<TenantStats>(indexes.Error());
    }

    TenantStats stats;
    stats.total_sessions = sessions.Value().size();
    stats.total_users = indexes.Value().size();
    for (const auto& session : sessions.Value()) {
        if (!session.is_active) {
            continue;
        }
        ++stats.active_sessions;
        const auto type = session.owner ? ToString(session.owner->user_type)
                                        : std::string("unknown");
        ++stats.user_type_distribution[type];
    }
    return Result<TenantStats, Error>::Ok(std::move(stats));
}

} // namespace mcp_gateway
