#include "makemcp/cli/app.hpp"
#include "makemcp/cli/commands.hpp"
#include "makemcp/core/logger.hpp"
#include "makemcp/core/version.hpp"

#include <algorithm>
#include <filesystem>

namespace makemcp::cli {

namespace fs = std::filesystem;

auto resolve_config(const GlobalOptions& options) -> Result<Config> {
    // Early messages (config loading) go out at the requested level too.
    Logger::init("makemcp", options.log_level.empty() ? "info" : options.log_level);

    Config config = options.config_path.empty()
        ? default_config()
        : load_config(fs::path(options.config_path));
    apply_env_overrides(config);

    if (!options.log_level.empty()) {
        config.log_level = options.log_level;
    }
    Logger::set_level(config.log_level);

    if (!options.make_path.empty()) {
        fs::path makefile(options.make_path);
        if (makefile.filename() != "Makefile") {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "--make-path must point at a file named Makefile", options.make_path));
        }
        config.makefile_dir = fs::absolute(makefile).parent_path().string();
    }
    if (!options.makefile_dir.empty()) {
        config.makefile_dir = options.makefile_dir;
    }
    if (!options.make_program.empty()) {
        config.execution.make_program = options.make_program;
    }
    if (options.timeout_ceiling > 0) {
        config.execution.max_timeout_seconds =
            std::min(options.timeout_ceiling, kMaxTimeoutSeconds);
    }
    config.execution.default_timeout_seconds = std::clamp(
        config.execution.default_timeout_seconds, 1, config.execution.max_timeout_seconds);

    LOG_DEBUG("Makefile directory: {}", resolve_makefile_dir(config).string());
    return config;
}

App::App()
    : cli_("makemcp", "Expose GNU Make targets to MCP clients")
{
    cli_.set_version_flag("--version", MAKEMCP_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", options_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("MAKEMCP_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", options_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.add_option("-C,--makefile-dir,--working-dir", options_.makefile_dir,
                    "Directory containing the Makefile (default: current directory)")
        ->check(CLI::ExistingDirectory);

    cli_.add_option("--make-path", options_.make_path,
                    "Path to the Makefile; its directory becomes the Makefile directory")
        ->check(CLI::ExistingFile)
        ->excludes("--makefile-dir");

    cli_.add_option("--make-program", options_.make_program,
                    "make executable to invoke (looked up on PATH)");

    cli_.add_option("--timeout-ceiling", options_.timeout_ceiling,
                    "Upper bound for per-target timeouts in seconds")
        ->check(CLI::Range(1, kMaxTimeoutSeconds));

    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::RuntimeError& e) {
        // Raised by subcommands after they reported the failure themselves.
        Logger::flush();
        return e.get_exit_code();
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // Subcommand callbacks run inside parse().
    Logger::flush();
    return 0;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::options() const -> const GlobalOptions& {
    return options_;
}

void App::setup_commands() {
    register_serve_command(cli_, options_);
    register_targets_command(cli_, options_);
    register_run_command(cli_, options_);
    register_version_command(cli_);
}

} // namespace makemcp::cli
