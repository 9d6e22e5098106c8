#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "makemcp/core/error.hpp"
#include "makemcp/tools/tool.hpp"

namespace makemcp::tools {

/// Every tool the server can expose.
enum class ToolKind {
    ListTargets,
    RunTarget,
};

[[nodiscard]] auto tool_name(ToolKind kind) -> std::string_view;

/// Wire name -> kind. Returns nullopt for names outside the table.
[[nodiscard]] auto tool_kind_from_name(std::string_view name) -> std::optional<ToolKind>;

/// Owns the tool handlers, keyed by ToolKind.
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// Takes ownership; replaces any handler already bound to `kind`.
    void register_tool(ToolKind kind, std::unique_ptr<Tool> tool);

    [[nodiscard]] auto get(ToolKind kind) const -> Tool*;

    /// Definitions in ToolKind order.
    [[nodiscard]] auto list() const -> std::vector<ToolDefinition>;

    /// Fails with UnknownTool when `name` is not in the table or has no
    /// handler bound.
    auto execute(std::string_view name, json arguments) -> awaitable<Result<std::string>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return tools_.size(); }

private:
    std::map<ToolKind, std::unique_ptr<Tool>> tools_;
};

} // namespace makemcp::tools
