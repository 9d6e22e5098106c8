#include "makemcp/tools/tool_registry.hpp"

#include <array>
#include <utility>

#include "makemcp/core/logger.hpp"

namespace makemcp::tools {

namespace {

constexpr std::array<std::pair<std::string_view, ToolKind>, 2> kToolTable{{
    {"list-targets", ToolKind::ListTargets},
    {"run-target", ToolKind::RunTarget},
}};

} // anonymous namespace

auto tool_name(ToolKind kind) -> std::string_view {
    for (const auto& [name, k] : kToolTable) {
        if (k == kind) return name;
    }
    return "unknown";
}

auto tool_kind_from_name(std::string_view name) -> std::optional<ToolKind> {
    for (const auto& [n, kind] : kToolTable) {
        if (n == name) return kind;
    }
    return std::nullopt;
}

void ToolRegistry::register_tool(ToolKind kind, std::unique_ptr<Tool> tool) {
    if (!tool) {
        LOG_WARN("Attempted to register a null tool for {}", tool_name(kind));
        return;
    }

    if (tools_.contains(kind)) {
        LOG_WARN("Replacing existing tool: {}", tool_name(kind));
    } else {
        LOG_DEBUG("Registered tool: {}", tool_name(kind));
    }
    tools_[kind] = std::move(tool);
}

auto ToolRegistry::get(ToolKind kind) const -> Tool* {
    auto it = tools_.find(kind);
    return it != tools_.end() ? it->second.get() : nullptr;
}

auto ToolRegistry::list() const -> std::vector<ToolDefinition> {
    std::vector<ToolDefinition> defs;
    defs.reserve(tools_.size());
    for (const auto& [kind, tool] : tools_) {
        defs.push_back(tool->definition());
    }
    return defs;
}

auto ToolRegistry::execute(std::string_view name, json arguments)
    -> awaitable<Result<std::string>> {
    auto kind = tool_kind_from_name(name);
    auto* tool = kind ? get(*kind) : nullptr;
    if (!tool) {
        co_return make_fail(make_error(ErrorCode::UnknownTool,
            "Unknown tool", std::string(name)));
    }

    LOG_DEBUG("Executing tool: {}", name);
    co_return co_await tool->execute(std::move(arguments));
}

} // namespace makemcp::tools
