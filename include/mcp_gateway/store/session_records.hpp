#pragma once

#include <mcp_gateway/core/clock.hpp>
#include <mcp_gateway/identity/identity.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// ApplicationSession — the logical session record (owner, payload, times).
//
// identity_hash is empty for sessions in the shared (unpartitioned)
// namespace. payload is always a JSON object.
// ---------------------------------------------------------------------------
struct ApplicationSession {
    std::string session_id;
    std::string identity_hash;
    std::string client_id;
    TimePoint created_at{};
    TimePoint last_accessed{};
    nlohmann::json payload = nlohmann::json::object();
    bool is_active = true;
    std::optional<Identity> owner;
};

// ---------------------------------------------------------------------------
// TransportSession — durable record that a live transport exists for a
// session id. The transport object itself is process-local.
// ---------------------------------------------------------------------------
struct TransportSession {
    std::string session_id;
    std::string transport_kind;
    std::string server_name;
    TimePoint created_at{};
    TimePoint last_accessed{};
    bool is_active = true;
};

// transport_kind used for existence-only bindings (no transport object).
inline constexpr std::string_view kReferenceTransportKind = "reference";

// -- JSON codecs -------------------------------------------------------------
// Encoders never fail. Decoders return nullopt on malformed or incomplete
// records; callers treat that as absence.

nlohmann::json IdentityToJson(const Identity& identity);
std::optional<Identity> IdentityFromJson(const nlohmann::json& j);

std::string EncodeApplicationSession(const ApplicationSession& session);
std::optional<ApplicationSession> DecodeApplicationSession(std::string_view text);

std::string EncodeTransportSession(const TransportSession& session);
std::optional<TransportSession> DecodeTransportSession(std::string_view text);

} // namespace mcp_gateway
