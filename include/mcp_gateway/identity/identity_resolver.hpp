#pragma once

#include <mcp_gateway/identity/identity.hpp>

#include <map>
#include <optional>
#include <string>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// RequestMetadata — the identity-relevant slice of an inbound request.
//
// Every field is optional; absence drives the anonymous fallback.
// verified_token is set by an upstream auth layer that already validated
// the credential and takes precedence over the raw authorization header.
// ---------------------------------------------------------------------------
struct RequestMetadata {
    std::optional<std::string> authorization;
    std::optional<std::string> user_agent;
    std::optional<std::string> client_ip;
    std::optional<std::string> verified_token;

    // Recognizes "authorization", "user-agent" and "client_ip" (also
    // "x-forwarded-for"), matching names case-insensitively.
    static RequestMetadata FromHeaderMap(
        const std::map<std::string, std::string>& headers);
};

// ---------------------------------------------------------------------------
// IdentityResolver — derives a stable identity from request metadata.
//
// Decision order:
//   1. "Bearer <jwt>"  -> claim sub/user_id, else jwt_user_<hash>
//                         (authenticated_user)
//   2. "ApiKey <key>"  -> api_user_<hash of key>  (service_account)
//   3. otherwise       -> anonymous_<hash of ip:ua>  (anonymous)
//
// The JWT signature is NOT checked here; verification belongs upstream.
// Resolve() is pure and never throws: malformed input degrades to the
// anonymous identity.
// ---------------------------------------------------------------------------
class IdentityResolver {
public:
    [[nodiscard]] Identity Resolve(const RequestMetadata& request) const;

private:
    [[nodiscard]] std::optional<Identity> FromBearer(
        const std::string& token, const RequestMetadata& request) const;
    [[nodiscard]] std::optional<Identity> FromApiKey(
        const std::string& key, const RequestMetadata& request) const;
    [[nodiscard]] Identity Anonymous(const RequestMetadata& request) const;
};

} // namespace mcp_gateway
