#include <mcp_gateway/core/digest.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace mcp_gateway {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

std::string ToHex(const unsigned char* data, std::size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0f]);
    }
    return out;
}

} // anonymous namespace

std::string Sha256Hex(std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return ToHex(digest, digest_len);
}

std::optional<std::string> Base64UrlDecode(std::string_view input) {
    // Strip trailing padding; we re-add the canonical amount below.
    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
    }
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string standard;
    standard.reserve(input.size() + 3);
    for (char c : input) {
        if (c == '-') {
            standard.push_back('+');
        } else if (c == '_') {
            standard.push_back('/');
        } else if (c == '+' || c == '/') {
            return std::nullopt;
        } else {
            standard.push_back(c);
        }
    }
    const std::size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');
    if (standard.empty()) {
        return std::string{};
    }

    std::vector<unsigned char> out(standard.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
        static_cast<int>(standard.size()));
    if (decoded < 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding positions as zero bytes.
    const auto length = static_cast<std::size_t>(decoded) - padding;
    return std::string(reinterpret_cast<const char*>(out.data()), length);
}

std::string RandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (num_bytes > 0 &&
        RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return ToHex(bytes.data(), bytes.size());
}

} // namespace mcp_gateway
