#include <mcp_gateway/store/session_store.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "store";

template <typename T>
Result<T, Error> Forward(const Error& error) {
    return Result<T, Error>::Err(error);
}

} // anonymous namespace

std::string ToString(StoreStatus status) {
    switch (status) {
        case StoreStatus::Ok:             return "ok";
        case StoreStatus::Absent:         return "absent";
        case StoreStatus::AlreadyHandled: return "already_handled";
    }
    return "ok";
}

SessionStore::SessionStore(IKeyValueBackend& backend, const IClock& clock,
                           SessionStoreOptions options)
    : backend_(backend), clock_(clock), options_(std::move(options)) {}

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------
std::string SessionStore::SessionPrefix(std::string_view tenant) const {
    if (tenant.empty()) {
        return options_.session_prefix;
    }
    return options_.tenant_session_prefix + std::string(tenant) + ":";
}

std::string SessionStore::SessionKey(std::string_view id,
                                     std::string_view tenant) const {
    return SessionPrefix(tenant) + std::string(id);
}

std::string SessionStore::TransportKey(std::string_view id) const {
    return options_.transport_prefix + std::string(id);
}

// ---------------------------------------------------------------------------
// Record I/O
// ---------------------------------------------------------------------------
Result<std::optional<ApplicationSession>, Error> SessionStore::ReadSession(
    const std::string& key) {
    auto raw = backend_.Get(key);
    if (raw.IsErr()) {
        return Forward<std::optional<ApplicationSession>>(raw.Error());
    }
    const auto& text = raw.Value();
    if (!text) {
        return Result<std::optional<ApplicationSession>, Error>::Ok(std::nullopt);
    }
    auto session = DecodeApplicationSession(*text);
    if (!session) {
        LogWarn(kComponent, "Undecodable session record at " + key +
                                "; treating as absent");
    }
    return Result<std::optional<ApplicationSession>, Error>::Ok(std::move(session));
}

Result<void, Error> SessionStore::WriteSession(const std::string& key,
                                               const ApplicationSession& session,
                                               std::chrono::seconds ttl) {
    return backend_.SetEx(key, ttl, EncodeApplicationSession(session));
}

Result<StoreStatus, Error> SessionStore::CreateAt(const std::string& key,
                                                  ApplicationSession fresh) {
    auto existing = ReadSession(key);
    if (existing.IsErr()) {
        return Forward<StoreStatus>(existing.Error());
    }
    if (existing.Value() && existing.Value()->is_active) {
        auto refreshed = backend_.Expire(key, options_.default_ttl);
        if (refreshed.IsErr()) {
            return Forward<StoreStatus>(refreshed.Error());
        }
        return Result<StoreStatus, Error>::Ok(StoreStatus::AlreadyHandled);
    }

    const auto now = clock_.Now();
    fresh.created_at = now;
    fresh.last_accessed = now;
    fresh.is_active = true;
    if (!fresh.payload.is_object()) {
        fresh.payload = nlohmann::json::object();
    }

    auto written = WriteSession(key, fresh, options_.default_ttl);
    if (written.IsErr()) {
        return Forward<StoreStatus>(written.Error());
    }
    LogDebug(kComponent, "Created session " + fresh.session_id);
    return Result<StoreStatus, Error>::Ok(StoreStatus::Ok);
}

// ---------------------------------------------------------------------------
// Application sessions
// ---------------------------------------------------------------------------
Result<StoreStatus, Error> SessionStore::Create(std::string_view id,
                                                std::string_view client_id,
                                                const nlohmann::json& payload,
                                                std::string_view tenant) {
    ApplicationSession fresh;
    fresh.session_id = std::string(id);
    fresh.identity_hash = std::string(tenant);
    fresh.client_id = std::string(client_id);
    fresh.payload = payload;
    return CreateAt(SessionKey(id, tenant), std::move(fresh));
}

Result<StoreStatus, Error> SessionStore::Create(std::string_view id,
                                                std::string_view client_id,
                                                const nlohmann::json& payload,
                                                const Identity& owner) {
    const auto tenant = IdentityHash(owner);
    ApplicationSession fresh;
    fresh.session_id = std::string(id);
    fresh.identity_hash = tenant;
    fresh.client_id = std::string(client_id);
    fresh.payload = payload;
    fresh.owner = owner;
    return CreateAt(SessionKey(id, tenant), std::move(fresh));
}

Result<std::optional<ApplicationSession>, Error> SessionStore::Get(
    std::string_view id, std::string_view tenant) {
    return ReadSession(SessionKey(id, tenant));
}

Result<StoreStatus, Error> SessionStore::Update(std::string_view id,
                                                const nlohmann::json& partial,
                                                std::string_view tenant) {
    const auto key = SessionKey(id, tenant);
    auto existing = ReadSession(key);
    if (existing.IsErr()) {
        return Forward<StoreStatus>(existing.Error());
    }
    if (!existing.Value()) {
        return Result<StoreStatus, Error>::Ok(StoreStatus::Absent);
    }

    auto session = *existing.Value();
    if (partial.is_object()) {
        for (const auto& [field, value] : partial.items()) {
            session.payload[field] = value;
        }
    }
    session.last_accessed = clock_.Now();

    auto written = WriteSession(key, session, options_.default_ttl);
    if (written.IsErr()) {
        return Forward<StoreStatus>(written.Error());
    }
    return Result<StoreStatus, Error>::Ok(StoreStatus::Ok);
}

Result<StoreStatus, Error> SessionStore::Delete(std::string_view id,
                                                std::string_view tenant) {
    auto removed = backend_.Del(SessionKey(id, tenant));
    if (removed.IsErr()) {
        return Forward<StoreStatus>(removed.Error());
    }
    return Result<StoreStatus, Error>::Ok(removed.Value() ? StoreStatus::Ok
                                                          : StoreStatus::Absent);
}

Result<StoreStatus, Error> SessionStore::Extend(std::string_view id,
                                                std::chrono::seconds ttl,
                                                std::string_view tenant) {
    auto extended = backend_.Expire(SessionKey(id, tenant), ttl);
    if (extended.IsErr()) {
        return Forward<StoreStatus>(extended.Error());
    }
    return Result<StoreStatus, Error>::Ok(extended.Value() ? StoreStatus::Ok
                                                           : StoreStatus::Absent);
}

Result<StoreStatus, Error> SessionStore::Deactivate(std::string_view id,
                                                    std::string_view tenant) {
    const auto key = SessionKey(id, tenant);
    auto existing = ReadSession(key);
    if (existing.IsErr()) {
        return Forward<StoreStatus>(existing.Error());
    }
    if (!existing.Value()) {
        return Result<StoreStatus, Error>::Ok(StoreStatus::Absent);
    }

    auto session = *existing.Value();
    session.is_active = false;
    session.last_accessed = clock_.Now();

    auto written = WriteSession(key, session, options_.grace_ttl);
    if (written.IsErr()) {
        return Forward<StoreStatus>(written.Error());
    }
    LogInfo(kComponent, "Deactivated session " + std::string(id));
    return Result<StoreStatus, Error>::Ok(StoreStatus::Ok);
}

Result<std::vector<std::string>, Error> SessionStore::ListStripped(
    const std::string& prefix) {
    auto keys = backend_.KeysWithPrefix(prefix);
    if (keys.IsErr()) {
        return Forward<std::vector<std::string>>(keys.Error());
    }
    std::vector<std::string> ids;
    ids.reserve(keys.Value().size());
    for (const auto& key : keys.Value()) {
        ids.push_back(key.substr(prefix.size()));
    }
    return Result<std::vector<std::string>, Error>::Ok(std::move(ids));
}

Result<std::vector<std::string>, Error> SessionStore::List(std::string_view tenant) {
    return ListStripped(SessionPrefix(tenant));
}

Result<std::vector<ApplicationSession>, Error> SessionStore::ScanTenantSessions() {
    auto keys = backend_.KeysWithPrefix(options_.tenant_session_prefix);
    if (keys.IsErr()) {
        return Forward<std::vector<ApplicationSession>>(keys.Error());
    }
    std::vector<ApplicationSession> sessions;
    for (const auto& key : keys.Value()) {
        auto session = ReadSession(key);
        if (session.IsErr()) {
            return Forward<std::vector<ApplicationSession>>(session.Error());
        }
        if (session.Value()) {
            sessions.push_back(*session.Value());
        }
    }
    return Result<std::vector<ApplicationSession>, Error>::Ok(std::move(sessions));
}

// ---------------------------------------------------------------------------
// Transport existence records
// ---------------------------------------------------------------------------
Result<void, Error> SessionStore::PutTransport(const TransportSession& record) {
    return backend_.SetEx(TransportKey(record.session_id), options_.default_ttl,
                          EncodeTransportSession(record));
}

Result<std::optional<TransportSession>, Error> SessionStore::GetTransport(
    std::string_view id) {
    const auto key = TransportKey(id);
    auto raw = backend_.Get(key);
    if (raw.IsErr()) {
        return Forward<std::optional<TransportSession>>(raw.Error());
    }
    const auto& text = raw.Value();
    if (!text) {
        return Result<std::optional<TransportSession>, Error>::Ok(std::nullopt);
    }
    auto record = DecodeTransportSession(*text);
    if (!record) {
        LogWarn(kComponent, "Undecodable transport record at " + key +
                                "; treating as absent");
    }
    return Result<std::optional<TransportSession>, Error>::Ok(std::move(record));
}

Result<StoreStatus, Error> SessionStore::TouchTransport(std::string_view id) {
    auto existing = GetTransport(id);
    if (existing.IsErr()) {
        return Forward<StoreStatus>(existing.Error());
    }
    if (!existing.Value()) {
        return Result<StoreStatus, Error>::Ok(StoreStatus::Absent);
    }
    auto record = *existing.Value();
    record.last_accessed = clock_.Now();
    auto written = PutTransport(record);
    if (written.IsErr()) {
        return Forward<StoreStatus>(written.Error());
    }
    return Result<StoreStatus, Error>::Ok(StoreStatus::Ok);
}

Result<StoreStatus, Error> SessionStore::DeleteTransport(std::string_view id) {
    auto removed = backend_.Del(TransportKey(id));
    if (removed.IsErr()) {
        return Forward<StoreStatus>(removed.Error());
    }
    return Result<StoreStatus, Error>::Ok(removed.Value() ? StoreStatus::Ok
                                                          : StoreStatus::Absent);
}

Result<std::vector<std::string>, Error> SessionStore::ListTransports() {
    return ListStripped(options_.transport_prefix);
}

Result<void, Error> SessionStore::Ping() {
    return backend_.Ping();
}

} // namespace mcp_gateway
