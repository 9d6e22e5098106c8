#pragma once

#include <CLI/CLI.hpp>

#include "makemcp/cli/app.hpp"

namespace makemcp::cli {

/// `serve`: MCP server on stdin/stdout until EOF or SIGINT/SIGTERM.
void register_serve_command(CLI::App& app, GlobalOptions& options);

/// `targets [--pattern]`: prints the targets the list-targets tool would.
void register_targets_command(CLI::App& app, GlobalOptions& options);

/// `run <target> [--timeout]`: runs one target with the server's safety
/// rules and relays its output.
void register_run_command(CLI::App& app, GlobalOptions& options);

void register_version_command(CLI::App& app);

} // namespace makemcp::cli
