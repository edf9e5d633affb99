#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

// Lowercase hex SHA-256 of the input (64 characters).
std::string Sha256Hex(std::string_view data);

// Decode base64url (RFC 4648 §5), padding optional. Returns nullopt on
// characters outside the alphabet or an impossible length.
std::optional<std::string> Base64UrlDecode(std::string_view input);

// Cryptographically random bytes rendered as lowercase hex (2 * num_bytes).
std::string RandomHex(std::size_t num_bytes);

} // namespace mcp_gateway
