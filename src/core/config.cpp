#include "makemcp/core/config.hpp"
#include "makemcp/core/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace makemcp {

namespace {

auto parse_int_env(const char* name, const char* value) -> std::optional<int> {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        LOG_WARN("Ignoring non-numeric {}='{}'", name, value);
        return std::nullopt;
    }
}

void normalize(Config& config) {
    auto& exec = config.execution;
    exec.max_timeout_seconds = std::clamp(exec.max_timeout_seconds, 1, kMaxTimeoutSeconds);
    exec.default_timeout_seconds =
        std::clamp(exec.default_timeout_seconds, 1, exec.max_timeout_seconds);
    if (exec.kill_grace_ms < 0) exec.kill_grace_ms = 0;
    if (exec.make_program.empty()) exec.make_program = "make";
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        auto config = json::parse(file).get<Config>();
        normalize(config);
        return config;
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("MAKEMCP_MAKEFILE_DIR")) {
        config.makefile_dir = val;
    }
    if (auto* val = std::getenv("MAKEMCP_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("MAKEMCP_MAKE_PROGRAM")) {
        config.execution.make_program = val;
    }
    if (auto* val = std::getenv("MAKEMCP_TIMEOUT_CEILING")) {
        if (auto seconds = parse_int_env("MAKEMCP_TIMEOUT_CEILING", val)) {
            config.execution.max_timeout_seconds = *seconds;
        }
    }
    normalize(config);
}

auto load_config_from_env() -> Config {
    Config config;
    apply_env_overrides(config);
    return config;
}

auto default_config() -> Config {
    return Config{};
}

auto resolve_makefile_dir(const Config& config) -> std::filesystem::path {
    if (config.makefile_dir && !config.makefile_dir->empty()) {
        return *config.makefile_dir;
    }
    return std::filesystem::current_path();
}

} // namespace makemcp
