#pragma once

#include <map>
#include <string>
#include <vector>

namespace makemcp::security {

using Environment = std::map<std::string, std::string>;

/// Prefixes of variable names that can alter how a child locates or loads
/// executables and libraries.
auto default_stripped_prefixes() -> std::vector<std::string>;

/// Snapshot of the current process environment.
auto current_environment() -> Environment;

/// Copy of `env` without any variable whose name starts with one of
/// `prefixes`. Prefix matching is case-sensitive.
auto sanitize_environment(const Environment& env,
                          const std::vector<std::string>& prefixes = default_stripped_prefixes())
    -> Environment;

/// KEY=VALUE strings in the form execve() expects.
auto to_envp(const Environment& env) -> std::vector<std::string>;

} // namespace makemcp::security
