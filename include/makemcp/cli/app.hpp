#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "makemcp/core/config.hpp"
#include "makemcp/core/error.hpp"

namespace makemcp::cli {

/// Options shared by every subcommand. Resolved into a Config by
/// resolve_config() once parsing is done.
struct GlobalOptions {
    std::string config_path;
    std::string log_level;
    std::string makefile_dir;
    std::string make_path;
    std::string make_program;
    int timeout_ceiling = 0;
};

/// Layers defaults, the config file, MAKEMCP_* variables and command-line
/// flags (in that order) and initialises the logger.
auto resolve_config(const GlobalOptions& options) -> Result<Config>;

/// Top-level CLI application.
///
/// Parses command-line arguments with CLI11 and dispatches to the
/// registered subcommands (serve, targets, run, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto options() const -> const GlobalOptions&;

private:
    void setup_commands();

    CLI::App cli_;
    GlobalOptions options_;
};

} // namespace makemcp::cli
