#include <mcp_gateway/mcp/tool_handlers.hpp>

#include <mcp_gateway/core/log.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "tools";

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeOkResult(const nlohmann::json& data) {
    return ToolResult{
        nlohmann::json::array({{{"type", "text"}, {"text", data.dump()}}}),
        std::nullopt};
}

ToolResult MakeErrorResult(ToolErrorKind kind, const std::string& msg) {
    return ToolResult{
        nlohmann::json::array({{{"type", "text"}, {"text", msg}}}),
        kind};
}

ToolResult MakeParamError(const std::string& msg) {
    return MakeErrorResult(ToolErrorKind::InvalidArguments, msg);
}

// Get a required string param. Returns nullopt and sets out_error on failure.
std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!params.contains(key) || !params[key].is_string() ||
        params[key].get<std::string>().empty()) {
        out_error = MakeParamError("Missing required parameter: " + key);
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

// Get a required numeric param.
std::optional<double> RequireNumber(const nlohmann::json& params,
                                    const std::string& key,
                                    ToolResult& out_error) {
    if (!params.contains(key)) {
        out_error = MakeParamError("Missing required parameter: " + key);
        return std::nullopt;
    }
    if (!params[key].is_number()) {
        out_error = MakeParamError("Both arguments must be numbers.");
        return std::nullopt;
    }
    return params[key].get<double>();
}

// Path segments go into a URL verbatim; refuse anything that would change
// the request target.
bool IsPathSegment(std::string_view value) {
    return std::none_of(value.begin(), value.end(), [](char c) {
        return c == '/' || c == '?' || c == '#' || c == '%' ||
               std::isspace(static_cast<unsigned char>(c));
    });
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Calculator
// ---------------------------------------------------------------------------

template <typename Op>
ToolHandler BinaryOp(Op op) {
    return [op](const nlohmann::json& params) -> ToolResult {
        ToolResult err;
        auto a = RequireNumber(params, "a", err);
        if (!a) return err;
        auto b = RequireNumber(params, "b", err);
        if (!b) return err;
        return op(*a, *b);
    };
}

nlohmann::json OperandSchema() {
    return MakeSchema({{"a", NumberProp("First operand")},
                       {"b", NumberProp("Second operand")}},
                      {"a", "b"});
}

// ---------------------------------------------------------------------------
// VirusTotal
// ---------------------------------------------------------------------------

ToolResult FetchReport(IVirusTotalClient& client, const std::string& api_key_name,
                       const SecretLookup& lookup, const std::string& path) {
    auto api_key = lookup(api_key_name);
    if (!api_key || api_key->empty()) {
        return MakeErrorResult(ToolErrorKind::NotConfigured,
                               api_key_name + " environment variable is not set.");
    }

    auto reply = client.Get(path, *api_key);
    if (reply.IsErr()) {
        return MakeErrorResult(ToolErrorKind::Upstream,
                               "Request failed: " + reply.Error().message);
    }

    const auto& http = reply.Value();
    auto body = nlohmann::json::parse(http.body, nullptr, false);
    if (http.status < 200 || http.status >= 300) {
        std::string message = http.body;
        if (body.is_object() && body.contains("error") && body["error"].is_object()) {
            message = body["error"].value("message", http.body);
        }
        return MakeErrorResult(ToolErrorKind::Upstream,
                               "API Error: " + message + " (Status code: " +
                                   std::to_string(http.status) + ")");
    }
    if (body.is_discarded()) {
        return MakeErrorResult(ToolErrorKind::Upstream,
                               "Request failed: response is not valid JSON");
    }
    return MakeOkResult(body);
}

// ---------------------------------------------------------------------------
// Employees
// ---------------------------------------------------------------------------

std::string Trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n\f\v");
    return std::string(text.substr(first, last - first + 1));
}

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

bool StartsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

Error MakeToolError(const std::string& operation, const std::string& message) {
    return Error{operation, "", message, ErrorCategory::Tool};
}

// Columns of the employees table as provisioned for this service.
nlohmann::json EmployeeSchema() {
    return nlohmann::json::object({
        {"id", "integer"},
        {"name", "character varying"},
        {"position", "character varying"},
        {"email", "character varying"},
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// EnvironmentLookup
// ---------------------------------------------------------------------------
std::optional<std::string> EnvironmentLookup(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

// ---------------------------------------------------------------------------
// HttpVirusTotalClient
// ---------------------------------------------------------------------------
struct HttpVirusTotalClient::Impl {
    std::string base_url;
    int timeout_seconds;
};

HttpVirusTotalClient::HttpVirusTotalClient(std::string base_url, int timeout_seconds)
    : impl_(std::make_unique<Impl>(Impl{std::move(base_url), timeout_seconds})) {}

HttpVirusTotalClient::~HttpVirusTotalClient() = default;

Result<HttpReply, Error> HttpVirusTotalClient::Get(const std::string& path,
                                                   const std::string& api_key) {
    // One client per call: tool handlers run on several workers at once.
    httplib::Client client(impl_->base_url);
    client.set_connection_timeout(impl_->timeout_seconds, 0);
    client.set_read_timeout(impl_->timeout_seconds, 0);

    const httplib::Headers headers = {
        {"x-apikey", api_key},
        {"Accept", "application/json"},
    };

    LogDebug(kComponent, "GET " + impl_->base_url + path);
    auto response = client.Get(path, headers);
    if (!response) {
        return Result<HttpReply, Error>::Err(
            Error{"VirusTotalGet", path, httplib::to_string(response.error()),
                  ErrorCategory::Tool});
    }
    return Result<HttpReply, Error>::Ok(HttpReply{response->status, response->body});
}

// ---------------------------------------------------------------------------
// ValidateEmployeeQuery
// ---------------------------------------------------------------------------
Result<std::string, Error> ValidateEmployeeQuery(std::string_view query) {
    const auto trimmed = Trim(query);
    const auto upper = ToUpper(trimmed);

    if (!StartsWith(upper, "SELECT")) {
        return Result<std::string, Error>::Err(
            MakeToolError("QueryEmployees", "Only SELECT queries are allowed."));
    }

    std::string after_from;
    const auto from = upper.find("FROM");
    if (from != std::string::npos) {
        after_from = Trim(std::string_view(upper).substr(from + 4));
    }
    if (!StartsWith(after_from, "EMPLOYEES")) {
        return Result<std::string, Error>::Err(MakeToolError(
            "QueryEmployees",
            "This tool can only query the 'employees' table. The query must "
            "start with 'SELECT ... FROM employees ...'."));
    }
    return Result<std::string, Error>::Ok(trimmed);
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------
void RegisterCalculatorTools(ToolRegistry& registry) {
    registry.Register(
        "calculator_multiply", "Multiplies two numbers together.", OperandSchema(),
        BinaryOp([](double a, double b) { return MakeOkResult(a * b); }));

    registry.Register(
        "calculator_divide", "Divides the first number by the second number.",
        OperandSchema(), BinaryOp([](double a, double b) {
            if (b == 0.0) {
                return MakeParamError("Division by zero is not allowed.");
            }
            return MakeOkResult(a / b);
        }));

    registry.Register(
        "calculator_add", "Adds two numbers together.", OperandSchema(),
        BinaryOp([](double a, double b) { return MakeOkResult(a + b); }));

    registry.Register(
        "calculator_subtract", "Subtracts the second number from the first.",
        OperandSchema(),
        BinaryOp([](double a, double b) { return MakeOkResult(a - b); }));
}

void RegisterVirusTotalTools(ToolRegistry& registry, IVirusTotalClient& client,
                             std::string api_key_name, SecretLookup lookup) {
    registry.Register(
        "virustotal_get_ip_report",
        "Fetches the VirusTotal report for a given IP address.",
        MakeSchema({{"ip_address", StringProp("IPv4 or IPv6 address")}},
                   {"ip_address"}),
        [&client, api_key_name, lookup](const nlohmann::json& params) -> ToolResult {
            ToolResult err;
            auto ip = RequireString(params, "ip_address", err);
            if (!ip) return err;
            if (!IsPathSegment(*ip)) {
                return MakeParamError("Invalid ip_address: " + *ip);
            }
            return FetchReport(client, api_key_name, lookup,
                               "/api/v3/ip_addresses/" + *ip);
        });

    registry.Register(
        "virustotal_get_domain_report",
        "Fetches the VirusTotal report for a given domain.",
        MakeSchema({{"domain", StringProp("Domain name, e.g. example.com")}},
                   {"domain"}),
        [&client, api_key_name, lookup](const nlohmann::json& params) -> ToolResult {
            ToolResult err;
            auto domain = RequireString(params, "domain", err);
            if (!domain) return err;
            if (!IsPathSegment(*domain)) {
                return MakeParamError("Invalid domain: " + *domain);
            }
            return FetchReport(client, api_key_name, lookup,
                               "/api/v3/domains/" + *domain);
        });
}

void RegisterEmployeeTools(ToolRegistry& registry, std::string database_url_name,
                           SecretLookup lookup) {
    registry.Register(
        "postgres_query_employees",
        "Executes a read-only SQL SELECT query on the 'employees' table.",
        MakeSchema({{"query", StringProp("SELECT statement reading FROM employees")}},
                   {"query"}),
        [database_url_name, lookup](const nlohmann::json& params) -> ToolResult {
            ToolResult err;
            auto query = RequireString(params, "query", err);
            if (!query) return err;

            auto validated = ValidateEmployeeQuery(*query);
            if (validated.IsErr()) {
                return MakeParamError(validated.Error().message);
            }

            auto database_url = lookup(database_url_name);
            if (!database_url || database_url->empty()) {
                return MakeErrorResult(ToolErrorKind::NotConfigured,
                                       database_url_name + " is not configured.");
            }
            return MakeErrorResult(
                ToolErrorKind::NotConfigured,
                "Query accepted but not executed: this build has no database client.");
        });

    registry.Register(
        "postgres_get_employee_schema",
        "Returns the schema information for the employees table.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [database_url_name, lookup](const nlohmann::json&) -> ToolResult {
            auto database_url = lookup(database_url_name);
            if (!database_url || database_url->empty()) {
                return MakeErrorResult(ToolErrorKind::NotConfigured,
                                       database_url_name + " is not configured.");
            }
            return MakeOkResult(EmployeeSchema());
        });
}

void RegisterSessionTools(ToolRegistry& registry, HealthReporter& reporter) {
    registry.Register(
        "session_health",
        "Session subsystem diagnostics: backend reachability, session counts, "
        "per-user-type distribution and recovery attempts.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [&reporter](const nlohmann::json&) -> ToolResult {
            return MakeOkResult(reporter.Snapshot().ToJson());
        });
}

} // namespace mcp_gateway
