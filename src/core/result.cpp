#include <mcp_gateway/core/result.hpp>

#include <iomanip>
#include <sstream>

namespace mcp_gateway {

namespace {

// Escape a string for embedding in a JSON string literal.
// core/ stays free of nlohmann::json so every module can include it.
std::string EscapeJson(const std::string& s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

} // anonymous namespace

Error Error::BackendUnavailable(const std::string& operation,
                                const std::string& key,
                                const std::string& message) {
    return Error{operation, key, "Session backend unavailable: " + message,
                 ErrorCategory::BackendUnavailable};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!key.empty()) {
        oss << " [" << key << "]";
    }
    oss << " (" << CategoryName() << "): " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{)";
    oss << R"("category":")" << CategoryName() << R"(",)";
    oss << R"("operation":")" << EscapeJson(operation) << R"(",)";
    if (!key.empty()) {
        oss << R"("key":")" << EscapeJson(key) << R"(",)";
    }
    oss << R"("message":")" << EscapeJson(message) << R"(",)";
    oss << R"("exit_code":)" << ExitCode();
    oss << R"(}})";
    return oss.str();
}

} // namespace mcp_gateway
