#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "makemcp/core/error.hpp"

namespace makemcp::security {

/// Caller-visible message for every rejected path. Escapes and resolution
/// failures are indistinguishable from the outside.
inline constexpr std::string_view kPathAccessDenied = "Path access denied";

/// Returns true if `candidate` lies inside `base` (or equals it), comparing
/// whole path segments. Both paths must already be canonical.
auto is_within(const std::filesystem::path& candidate,
               const std::filesystem::path& base) -> bool;

/// Resolves `base` (and `subpath` beneath it, when given) following symlinks
/// and collapsing `..`, then requires the result to stay inside the
/// canonical base. The returned path is absolute and canonical.
/// Fails with ErrorCode::SecurityViolation.
auto validate_path(const std::filesystem::path& base,
                   const std::optional<std::filesystem::path>& subpath = std::nullopt)
    -> Result<std::filesystem::path>;

} // namespace makemcp::security
