#include <mcp_gateway/mcp/tool_registry.hpp>

#include <mcp_gateway/core/log.hpp>

namespace mcp_gateway {

namespace {

constexpr const char* kComponent = "tools";

ToolResult TextError(ToolErrorKind kind, const std::string& text) {
    return ToolResult{
        nlohmann::json::array({{{"type", "text"}, {"text", text}}}),
        kind};
}

} // anonymous namespace

std::string_view ToString(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::InvalidArguments: return "invalid_arguments";
        case ToolErrorKind::NotConfigured:    return "not_configured";
        case ToolErrorKind::Upstream:         return "upstream";
        case ToolErrorKind::UnknownTool:      return "unknown_tool";
        case ToolErrorKind::Internal:         return "internal";
    }
    return "internal";
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    if (handlers_.count(name) == 0) {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return TextError(ToolErrorKind::UnknownTool, "Unknown tool: " + name);
    }

    ToolResult result;
    try {
        result = it->second(params);
    } catch (const std::exception& e) {
        result = TextError(ToolErrorKind::Internal,
                           std::string("Tool error: ") + e.what());
    }
    if (result.IsError()) {
        LogWarn(kComponent, "Tool " + name + " failed (" +
                                std::string(ToString(*result.error)) + ")");
    }
    return result;
}

} // namespace mcp_gateway
