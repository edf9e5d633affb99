#include <mcp_gateway/identity/identity_resolver.hpp>

#include <mcp_gateway/core/digest.hpp>
#include <mcp_gateway/core/log.hpp>

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "identity";
constexpr const char* kUnknown = "unknown";
constexpr std::size_t kSyntheticIdHexLength = 12;
constexpr std::size_t kApiKeyHashLength = 8;
constexpr std::size_t kTokenPrefixBytes = 16;

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string Trim(std::string_view s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(begin, end - begin + 1));
}

// If value starts with "<scheme> " (case-insensitive), returns the
// trimmed remainder.
std::optional<std::string> StripScheme(std::string_view value,
                                       std::string_view scheme) {
    if (value.size() <= scheme.size() ||
        ToLower(value.substr(0, scheme.size())) != scheme ||
        value[scheme.size()] != ' ') {
        return std::nullopt;
    }
    return Trim(value.substr(scheme.size() + 1));
}

std::string ShortHash(std::string_view material, std::size_t length) {
    return Sha256Hex(material).substr(0, length);
}

// Unverified claim extraction from the payload segment of a JWT.
std::optional<std::string> ReadSubjectClaim(const std::string& token) {
    auto first_dot = token.find('.');
    if (first_dot == std::string::npos) {
        return std::nullopt;
    }
    auto second_dot = token.find('.', first_dot + 1);
    if (second_dot == std::string::npos) {
        return std::nullopt;
    }
    auto payload = Base64UrlDecode(
        std::string_view(token).substr(first_dot + 1, second_dot - first_dot - 1));
    if (!payload) {
        return std::nullopt;
    }

    auto claims = nlohmann::json::parse(*payload, nullptr, /*allow_exceptions=*/false);
    if (claims.is_discarded() || !claims.is_object()) {
        return std::nullopt;
    }
    for (const char* field : {"sub", "user_id"}) {
        auto it = claims.find(field);
        if (it != claims.end() && it->is_string() &&
            !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

std::map<std::string, std::string> BaseMetadata(const RequestMetadata& request) {
    return {
        {"client_ip", request.client_ip.value_or(kUnknown)},
        {"user_agent", request.user_agent.value_or(kUnknown)},
    };
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RequestMetadata
// ---------------------------------------------------------------------------
RequestMetadata RequestMetadata::FromHeaderMap(
    const std::map<std::string, std::string>& headers) {
    RequestMetadata request;
    for (const auto& [name, value] : headers) {
        auto lower = ToLower(name);
        if (lower == "authorization") {
            request.authorization = value;
        } else if (lower == "user-agent") {
            request.user_agent = value;
        } else if (lower == "client_ip") {
            request.client_ip = value;
        } else if (lower == "x-forwarded-for" && !request.client_ip) {
            // First hop only.
            request.client_ip = Trim(std::string_view(value).substr(0, value.find(',')));
        }
    }
    return request;
}

// ---------------------------------------------------------------------------
// IdentityResolver
// ---------------------------------------------------------------------------
Identity IdentityResolver::Resolve(const RequestMetadata& request) const {
    if (request.verified_token && !request.verified_token->empty()) {
        if (auto identity = FromBearer(*request.verified_token, request)) {
            return *identity;
        }
    }

    if (request.authorization) {
        const auto& header = *request.authorization;
        if (auto token = StripScheme(header, "bearer")) {
            if (auto identity = FromBearer(*token, request)) {
                return *identity;
            }
        } else if (auto key = StripScheme(header, "apikey")) {
            if (auto identity = FromApiKey(*key, request)) {
                return *identity;
            }
        } else if (!Trim(header).empty()) {
            LogDebug(kComponent, "Unrecognized authorization scheme; "
                                 "resolving as anonymous");
        }
    }

    return Anonymous(request);
}

std::optional<Identity> IdentityResolver::FromBearer(
    const std::string& token, const RequestMetadata& request) const {
    if (token.empty()) {
        LogDebug(kComponent, "Empty bearer credential; resolving as anonymous");
        return std::nullopt;
    }

    Identity identity;
    identity.user_type = UserType::AuthenticatedUser;
    identity.auth_method = AuthMethod::Jwt;
    identity.metadata = BaseMetadata(request);
    identity.metadata["auth_method"] = "jwt";

    if (auto claim = ReadSubjectClaim(token)) {
        identity.user_id = *claim;
    } else {
        LogDebug(kComponent, "Bearer token carries no readable subject claim");
        identity.user_id =
            "jwt_user_" + ShortHash(token.substr(0, kTokenPrefixBytes),
                                    kSyntheticIdHexLength);
    }
    return identity;
}

std::optional<Identity> IdentityResolver::FromApiKey(
    const std::string& key, const RequestMetadata& request) const {
    if (key.empty()) {
        LogDebug(kComponent, "Empty API key credential; resolving as anonymous");
        return std::nullopt;
    }

    Identity identity;
    identity.user_id = "api_user_" + ShortHash(key, kSyntheticIdHexLength);
    identity.user_type = UserType::ServiceAccount;
    identity.auth_method = AuthMethod::ApiKey;
    identity.metadata = BaseMetadata(request);
    identity.metadata["api_key_hash"] = ShortHash(key, kApiKeyHashLength);
    return identity;
}

Identity IdentityResolver::Anonymous(const RequestMetadata& request) const {
    const auto ip = request.client_ip.value_or(kUnknown);
    const auto ua = request.user_agent.value_or(kUnknown);

    Identity identity;
    identity.user_id = "anonymous_" + ShortHash(ip + ":" + ua, kSyntheticIdHexLength);
    identity.user_type = UserType::Anonymous;
    identity.auth_method = AuthMethod::Anonymous;
    identity.metadata = BaseMetadata(request);
    return identity;
}

} // namespace mcp_gateway
