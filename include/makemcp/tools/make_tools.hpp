#pragma once

#include <memory>

#include "makemcp/exec/execution_manager.hpp"
#include "makemcp/resources/resource_catalog.hpp"
#include "makemcp/tools/tool.hpp"
#include "makemcp/tools/tool_registry.hpp"

namespace makemcp::tools {

/// `list-targets {pattern?}`: one `name: description` line per target whose
/// name the ECMAScript regex finds a match in. `*` or no pattern lists all.
class ListTargetsTool final : public Tool {
public:
    explicit ListTargetsTool(const resources::ResourceCatalog& catalog);

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json arguments) -> awaitable<Result<std::string>> override;

private:
    const resources::ResourceCatalog& catalog_;
};

/// `run-target {target, timeout?}`: runs the target and returns its stdout.
class RunTargetTool final : public Tool {
public:
    explicit RunTargetTool(exec::ExecutionManager& manager);

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json arguments) -> awaitable<Result<std::string>> override;

private:
    exec::ExecutionManager& manager_;
};

/// Formats targets as the list-targets tool does.
[[nodiscard]] auto format_target_list(const std::vector<make::Target>& targets) -> std::string;

/// Keeps the targets whose name matches `pattern`. Fails with InvalidPattern.
auto filter_targets(std::vector<make::Target> targets, std::string_view pattern)
    -> Result<std::vector<make::Target>>;

void register_make_tools(ToolRegistry& registry,
                         const resources::ResourceCatalog& catalog,
                         exec::ExecutionManager& manager);

} // namespace makemcp::tools
