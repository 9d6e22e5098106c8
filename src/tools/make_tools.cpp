#include "makemcp/tools/make_tools.hpp"

#include <algorithm>
#include <cstdint>
#include <regex>

#include "makemcp/core/logger.hpp"

namespace makemcp::tools {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

auto format_target_list(const std::vector<make::Target>& targets) -> std::string {
    std::string out;
    for (const auto& target : targets) {
        if (!out.empty()) out += '\n';
        out += target.name;
        out += ": ";
        out += target.description.value_or("No description");
    }
    return out;
}

auto filter_targets(std::vector<make::Target> targets, std::string_view pattern)
    -> Result<std::vector<make::Target>> {
    if (pattern.empty() || pattern == "*") {
        return targets;
    }

    std::regex re;
    try {
        re = std::regex(std::string(pattern), std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return std::unexpected(make_error(ErrorCode::InvalidPattern,
            "Invalid pattern: " + std::string(pattern), e.what()));
    }

    std::erase_if(targets, [&re](const make::Target& target) {
        return !std::regex_search(target.name, re);
    });
    return targets;
}

// ---------------------------------------------------------------------------
// ListTargetsTool
// ---------------------------------------------------------------------------

ListTargetsTool::ListTargetsTool(const resources::ResourceCatalog& catalog)
    : catalog_(catalog) {}

auto ListTargetsTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = std::string(tool_name(ToolKind::ListTargets)),
        .description = "List available Make targets with their descriptions",
        .parameters = {
            {
                .name = "pattern",
                .type = "string",
                .description = "Regular expression to filter target names ('*' lists all)",
                .required = false,
                .default_value = json("*"),
            },
        },
    };
}

auto ListTargetsTool::execute(json arguments) -> awaitable<Result<std::string>> {
    std::string pattern = "*";
    if (arguments.contains("pattern") && !arguments["pattern"].is_null()) {
        if (!arguments["pattern"].is_string()) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument,
                "pattern must be a string"));
        }
        pattern = arguments["pattern"].get<std::string>();
    }

    auto targets = catalog_.list_targets();
    if (!targets) {
        co_return make_fail(targets.error());
    }

    auto filtered = filter_targets(std::move(*targets), pattern);
    if (!filtered) {
        co_return make_fail(filtered.error());
    }

    LOG_DEBUG("list-targets pattern='{}' matched {}", pattern, filtered->size());
    co_return format_target_list(*filtered);
}

// ---------------------------------------------------------------------------
// RunTargetTool
// ---------------------------------------------------------------------------

RunTargetTool::RunTargetTool(exec::ExecutionManager& manager)
    : manager_(manager) {}

auto RunTargetTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = std::string(tool_name(ToolKind::RunTarget)),
        .description = "Run a Make target and return its output",
        .parameters = {
            {
                .name = "target",
                .type = "string",
                .description = "Name of the target to run",
            },
            {
                .name = "timeout",
                .type = "integer",
                .description = "Maximum execution time in seconds",
                .required = false,
                .default_value = json(manager_.config().default_timeout_seconds),
                .minimum = 1,
                .maximum = manager_.clamp_timeout(kMaxTimeoutSeconds),
            },
        },
    };
}

auto RunTargetTool::execute(json arguments) -> awaitable<Result<std::string>> {
    if (!arguments.contains("target") || !arguments["target"].is_string() ||
        arguments["target"].get_ref<const std::string&>().empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Target name required"));
    }

    exec::ExecutionRequest request;
    request.target = arguments["target"].get<std::string>();
    request.timeout_seconds = manager_.config().default_timeout_seconds;

    if (arguments.contains("timeout") && !arguments["timeout"].is_null()) {
        const auto& timeout = arguments["timeout"];
        if (!timeout.is_number_integer()) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument,
                "timeout must be an integer number of seconds"));
        }
        // Unsigned values past INT64_MAX would wrap negative through get<int64_t>().
        auto seconds = timeout.is_number_unsigned()
            ? static_cast<int64_t>(std::min<uint64_t>(timeout.get<uint64_t>(), kMaxTimeoutSeconds))
            : std::clamp<int64_t>(timeout.get<int64_t>(), 0, kMaxTimeoutSeconds);
        request.timeout_seconds = manager_.clamp_timeout(static_cast<int>(seconds));
    }

    auto result = co_await manager_.run(std::move(request));
    if (!result) {
        co_return make_fail(result.error());
    }
    co_return std::move(result->stdout_output);
}

void register_make_tools(ToolRegistry& registry,
                         const resources::ResourceCatalog& catalog,
                         exec::ExecutionManager& manager) {
    registry.register_tool(ToolKind::ListTargets, std::make_unique<ListTargetsTool>(catalog));
    registry.register_tool(ToolKind::RunTarget, std::make_unique<RunTargetTool>(manager));
}

} // namespace makemcp::tools
