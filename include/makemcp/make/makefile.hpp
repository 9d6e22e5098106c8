#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "makemcp/core/error.hpp"

namespace makemcp::make {

inline constexpr std::string_view kMakefileName = "Makefile";

/// Validated path of `dir/Makefile`.
/// Fails with SecurityViolation if `dir` cannot be resolved, MakefileNotFound
/// if it holds no Makefile.
auto locate_makefile(const std::filesystem::path& dir) -> Result<std::filesystem::path>;

auto read_makefile(const std::filesystem::path& path) -> Result<std::string>;

/// Coarse sanity check, not a Make parser: content must not be blank and no
/// line may start with '.' unless it also contains ':'.
auto validate_makefile_syntax(std::string_view content) -> VoidResult;

} // namespace makemcp::make
