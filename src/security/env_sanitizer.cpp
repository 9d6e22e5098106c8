#include "makemcp/security/env_sanitizer.hpp"

#include <algorithm>

#include "makemcp/core/logger.hpp"

extern char** environ;

namespace makemcp::security {

auto default_stripped_prefixes() -> std::vector<std::string> {
    return {"LD_", "DYLD_", "PATH"};
}

auto current_environment() -> Environment {
    Environment env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) continue;
        env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return env;
}

auto sanitize_environment(const Environment& env, const std::vector<std::string>& prefixes)
    -> Environment {
    Environment result;
    for (const auto& [key, value] : env) {
        bool stripped = std::ranges::any_of(prefixes, [&key](const std::string& prefix) {
            return !prefix.empty() && key.starts_with(prefix);
        });
        if (stripped) {
            LOG_TRACE("Stripping {} from child environment", key);
            continue;
        }
        result.emplace(key, value);
    }
    return result;
}

auto to_envp(const Environment& env) -> std::vector<std::string> {
    std::vector<std::string> envp;
    envp.reserve(env.size());
    for (const auto& [key, value] : env) {
        envp.push_back(key + "=" + value);
    }
    return envp;
}

} // namespace makemcp::security
