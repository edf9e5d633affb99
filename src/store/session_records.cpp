#include <mcp_gateway/store/session_records.hpp>

namespace mcp_gateway {

namespace {

std::optional<std::string> StringField(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<TimePoint> TimeField(const nlohmann::json& j, const char* key) {
    auto text = StringField(j, key);
    if (!text) {
        return std::nullopt;
    }
    return ParseIso8601(*text);
}

bool BoolField(const nlohmann::json& j, const char* key, bool default_value) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return default_value;
    }
    return it->get<bool>();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Identity
// ---------------------------------------------------------------------------
nlohmann::json IdentityToJson(const Identity& identity) {
    return {
        {"user_id", identity.user_id},
        {"user_type", ToString(identity.user_type)},
        {"metadata", identity.metadata},
        {"authentication_method", ToString(identity.auth_method)},
    };
}

std::optional<Identity> IdentityFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto user_id = StringField(j, "user_id");
    auto user_type_name = StringField(j, "user_type");
    auto method_name = StringField(j, "authentication_method");
    if (!user_id || !user_type_name || !method_name) {
        return std::nullopt;
    }
    auto user_type = ParseUserType(*user_type_name);
    auto method = ParseAuthMethod(*method_name);
    if (!user_type || !method) {
        return std::nullopt;
    }

    Identity identity;
    identity.user_id = *user_id;
    identity.user_type = *user_type;
    identity.auth_method = *method;
    if (auto meta = j.find("metadata"); meta != j.end() && meta->is_object()) {
        for (const auto& [key, value] : meta->items()) {
            if (value.is_string()) {
                identity.metadata[key] = value.get<std::string>();
            }
        }
    }
    return identity;
}

// ---------------------------------------------------------------------------
// ApplicationSession
// ---------------------------------------------------------------------------
std::string EncodeApplicationSession(const ApplicationSession& session) {
    nlohmann::json j = {
        {"session_id", session.session_id},
        {"identity_hash", session.identity_hash},
        {"client_id", session.client_id},
        {"created_at", FormatIso8601(session.created_at)},
        {"last_accessed", FormatIso8601(session.last_accessed)},
        {"data", session.payload.is_object() ? session.payload
                                              : nlohmann::json::object()},
        {"is_active", session.is_active},
    };
    if (session.owner) {
        j["user_context"] = IdentityToJson(*session.owner);
    }
    return j.dump();
}

std::optional<ApplicationSession> DecodeApplicationSession(std::string_view text) {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto session_id = StringField(j, "session_id");
    auto client_id = StringField(j, "client_id");
    auto created_at = TimeField(j, "created_at");
    auto last_accessed = TimeField(j, "last_accessed");
    if (!session_id || !client_id || !created_at || !last_accessed) {
        return std::nullopt;
    }

    ApplicationSession session;
    session.session_id = *session_id;
    session.identity_hash = StringField(j, "identity_hash").value_or("");
    session.client_id = *client_id;
    session.created_at = *created_at;
    session.last_accessed = *last_accessed;
    if (auto data = j.find("data"); data != j.end() && data->is_object()) {
        session.payload = *data;
    }
    session.is_active = BoolField(j, "is_active", true);
    if (auto ctx = j.find("user_context"); ctx != j.end()) {
        session.owner = IdentityFromJson(*ctx);
    }
    return session;
}

// ---------------------------------------------------------------------------
// TransportSession
// ---------------------------------------------------------------------------
std::string EncodeTransportSession(const TransportSession& session) {
    nlohmann::json j = {
        {"session_id", session.session_id},
        {"transport_type", session.transport_kind},
        {"created_at", FormatIso8601(session.created_at)},
        {"last_accessed", FormatIso8601(session.last_accessed)},
        {"server_name", session.server_name},
        {"is_active", session.is_active},
    };
    return j.dump();
}

std::optional<TransportSession> DecodeTransportSession(std::string_view text) {
    auto j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto session_id = StringField(j, "session_id");
    auto kind = StringField(j, "transport_type");
    auto server_name = StringField(j, "server_name");
    auto created_at = TimeField(j, "created_at");
    auto last_accessed = TimeField(j, "last_accessed");
    if (!session_id || !kind || !server_name || !created_at || !last_accessed) {
        return std::nullopt;
    }

    TransportSession session;
    session.session_id = *session_id;
    session.transport_kind = *kind;
    session.server_name = *server_name;
    session.created_at = *created_at;
    session.last_accessed = *last_accessed;
    session.is_active = BoolField(j, "is_active", true);
    return session;
}

} // namespace mcp_gateway
