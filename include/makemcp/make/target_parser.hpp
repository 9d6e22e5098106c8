#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "makemcp/core/config.hpp"

namespace makemcp::make {

struct Target {
    std::string name;
    std::optional<std::string> description;

    auto operator==(const Target&) const -> bool = default;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Target, name, description)

/// ASCII-only `^[A-Za-z0-9][A-Za-z0-9_-]*$`.
[[nodiscard]] auto is_valid_target_name(std::string_view name) -> bool;

/// Extracts explicit targets and their descriptions from Makefile text.
///
/// Descriptions come from an inline `## text` on the target line or, failing
/// that, from the `#` comment lines directly above it. The scan is purely
/// textual: no include expansion, no variable evaluation, no pattern rules.
/// Lines that do not look like a valid target are skipped; the parse
/// itself never fails.
[[nodiscard]] auto parse_targets(std::string_view content) -> std::vector<Target>;

} // namespace makemcp::make
