#pragma once

#include <mcp_gateway/core/result.hpp>
#include <mcp_gateway/mcp/tool_registry.hpp>
#include <mcp_gateway/session/health.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_gateway {

// Looks up a named secret (API key, connection string). Returns nullopt
// when it is not set.
using SecretLookup =
    std::function<std::optional<std::string>(const std::string& name)>;

// Reads the process environment.
std::optional<std::string> EnvironmentLookup(const std::string& name);

// ---------------------------------------------------------------------------
// IVirusTotalClient — GET against the VirusTotal v3 API.
//
// A reply with any HTTP status is Ok; only transport failures (DNS,
// connect, TLS, timeout) are Err.
// ---------------------------------------------------------------------------
struct HttpReply {
    int status = 0;
    std::string body;
};

class IVirusTotalClient {
public:
    virtual ~IVirusTotalClient() = default;

    [[nodiscard]] virtual Result<HttpReply, Error> Get(const std::string& path,
                                                       const std::string& api_key) = 0;
};

// cpp-httplib implementation. base_url is scheme://host[:port].
class HttpVirusTotalClient : public IVirusTotalClient {
public:
    explicit HttpVirusTotalClient(std::string base_url, int timeout_seconds = 30);
    ~HttpVirusTotalClient() override;

    HttpVirusTotalClient(const HttpVirusTotalClient&) = delete;
    HttpVirusTotalClient& operator=(const HttpVirusTotalClient&) = delete;

    [[nodiscard]] Result<HttpReply, Error> Get(const std::string& path,
                                               const std::string& api_key) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Check that query is a SELECT reading the employees table. Returns the
// trimmed query, or a Tool error carrying the user-facing message.
Result<std::string, Error> ValidateEmployeeQuery(std::string_view query);

// calculator_multiply, calculator_divide, calculator_add, calculator_subtract
void RegisterCalculatorTools(ToolRegistry& registry);

// virustotal_get_ip_report, virustotal_get_domain_report. The API key is
// looked up under api_key_name on every call.
void RegisterVirusTotalTools(ToolRegistry& registry, IVirusTotalClient& client,
                             std::string api_key_name, SecretLookup lookup);

// postgres_query_employees, postgres_get_employee_schema
void RegisterEmployeeTools(ToolRegistry& registry, std::string database_url_name,
                           SecretLookup lookup);

// session_health
void RegisterSessionTools(ToolRegistry& registry, HealthReporter& reporter);

} // namespace mcp_gateway
