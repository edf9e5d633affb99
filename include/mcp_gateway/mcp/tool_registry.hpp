#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_gateway {

// ---------------------------------------------------------------------------
// ToolSchema — JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// Why a tool call failed. Reported to the client as an isError result,
// never as a JSON-RPC error.
enum class ToolErrorKind {
    InvalidArguments,
    NotConfigured,
    Upstream,
    UnknownTool,
    Internal,
};

[[nodiscard]] std::string_view ToString(ToolErrorKind kind);

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    nlohmann::json content = nlohmann::json::array();  // content blocks
    std::optional<ToolErrorKind> error;

    [[nodiscard]] bool IsError() const noexcept { return error.has_value(); }
};

// A tool handler takes a JSON params object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolRegistry — registry of MCP tools. Handlers may run on several worker
// threads at once; the registry itself is immutable after startup.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& params) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mcp_gateway
