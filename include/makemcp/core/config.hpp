#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "makemcp/core/types.hpp"

// std::optional serializer for nlohmann/json: lets the NLOHMANN_DEFINE macros
// handle optional fields (null <-> nullopt).
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace makemcp {

/// Hard ceiling on any single target execution, in seconds.
inline constexpr int kMaxTimeoutSeconds = 3600;
inline constexpr int kDefaultTimeoutSeconds = 300;

struct ExecutionConfig {
    std::string make_program = "make";
    int default_timeout_seconds = kDefaultTimeoutSeconds;
    int max_timeout_seconds = kMaxTimeoutSeconds;  // clamped to kMaxTimeoutSeconds
    int kill_grace_ms = 2000;                      // SIGTERM -> SIGKILL window
    std::vector<std::string> stripped_env_prefixes = {"LD_", "DYLD_", "PATH"};
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExecutionConfig, make_program, default_timeout_seconds, max_timeout_seconds, kill_grace_ms, stripped_env_prefixes)

struct Config {
    std::optional<std::string> makefile_dir;  // defaults to the current directory
    std::string log_level = "info";
    ExecutionConfig execution;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, makefile_dir, log_level, execution)

auto load_config(const std::filesystem::path& path) -> Config;
auto load_config_from_env() -> Config;
auto default_config() -> Config;

/// Overlays MAKEMCP_* environment variables onto an existing config.
void apply_env_overrides(Config& config);

/// Directory the server operates on: config value or the process cwd.
auto resolve_makefile_dir(const Config& config) -> std::filesystem::path;

} // namespace makemcp
