#include "makemcp/cli/commands.hpp"
#include "makemcp/core/logger.hpp"
#include "makemcp/core/version.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "makemcp/exec/execution_manager.hpp"
#include "makemcp/resources/resource_catalog.hpp"
#include "makemcp/server/server.hpp"
#include "makemcp/tools/make_tools.hpp"

namespace makemcp::cli {

namespace net = boost::asio;

namespace {

/// Resolves the config or reports the problem and aborts the command.
auto require_config(const GlobalOptions& options) -> Config {
    auto config = resolve_config(options);
    if (!config) {
        std::cerr << "makemcp: " << config.error().what() << "\n";
        throw CLI::RuntimeError(1);
    }
    return std::move(*config);
}

[[noreturn]] void fail(const Error& error) {
    LOG_ERROR("{}: {}", error_code_to_string(error.code()), error.what());
    std::cerr << "makemcp: " << error.what() << "\n";
    throw CLI::RuntimeError(1);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("serve", "Run the MCP server on stdin/stdout");

    sub->callback([&options]() {
        auto config = require_config(options);

        net::io_context ioc;
        server::McpServer mcp(ioc, server::ServerConfig{
            .makefile_dir = resolve_makefile_dir(config),
            .execution = config.execution,
        });

        if (auto ok = mcp.check_makefile(); !ok) {
            fail(ok.error());
        }

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&mcp](auto ec, int sig) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", sig);
                mcp.shutdown();
            }
        });

        net::co_spawn(ioc, [&mcp, &signals]() -> net::awaitable<void> {
            co_await mcp.run_stdio();
            boost::system::error_code ignored;
            signals.cancel(ignored);
        }, net::detached);

        ioc.run();
        LOG_INFO("Server stopped");
    });
}

// ---------------------------------------------------------------------------
// targets command
// ---------------------------------------------------------------------------

void register_targets_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("targets", "List Makefile targets with descriptions");

    auto pattern = std::make_shared<std::string>("*");
    sub->add_option("-p,--pattern", *pattern, "Regular expression filtering target names");

    sub->callback([&options, pattern]() {
        auto config = require_config(options);

        resources::ResourceCatalog catalog(resolve_makefile_dir(config));
        auto targets = catalog.list_targets();
        if (!targets) fail(targets.error());

        auto filtered = tools::filter_targets(std::move(*targets), *pattern);
        if (!filtered) fail(filtered.error());

        if (!filtered->empty()) {
            std::cout << tools::format_target_list(*filtered) << "\n";
        }
    });
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, GlobalOptions& options) {
    auto* sub = app.add_subcommand("run", "Run one Makefile target");

    struct RunOptions {
        std::string target;
        std::optional<int> timeout;
    };
    auto run_options = std::make_shared<RunOptions>();
    sub->add_option("target", run_options->target, "Target name")->required();
    sub->add_option("-t,--timeout", run_options->timeout, "Timeout in seconds")
        ->check(CLI::Range(1, kMaxTimeoutSeconds));

    sub->callback([&options, run_options]() {
        auto config = require_config(options);

        exec::ExecutionManager manager(resolve_makefile_dir(config), config.execution);
        exec::ExecutionRequest request{
            .target = run_options->target,
            .timeout_seconds = run_options->timeout.value_or(config.execution.default_timeout_seconds),
        };

        net::io_context ioc;
        net::cancellation_signal cancel;
        std::optional<Result<exec::ExecutionResult>> outcome;
        bool interrupted = false;

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&cancel, &interrupted](auto ec, int) {
            if (!ec) {
                interrupted = true;
                cancel.emit(net::cancellation_type::terminal);
            }
        });

        net::co_spawn(ioc, manager.run(std::move(request)),
            net::bind_cancellation_slot(cancel.slot(),
                [&outcome, &signals](std::exception_ptr ep, Result<exec::ExecutionResult> result) {
                    boost::system::error_code ignored;
                    signals.cancel(ignored);
                    if (ep) {
                        try {
                            std::rethrow_exception(ep);
                        } catch (const boost::system::system_error& e) {
                            if (e.code() != net::error::operation_aborted) {
                                LOG_ERROR("run failed: {}", e.what());
                            }
                        } catch (const std::exception& e) {
                            LOG_ERROR("run failed: {}", e.what());
                        }
                        return;
                    }
                    outcome = std::move(result);
                }));

        ioc.run();

        if (interrupted) {
            std::cerr << "makemcp: interrupted\n";
            throw CLI::RuntimeError(130);
        }
        if (!outcome) {
            std::cerr << "makemcp: run aborted\n";
            throw CLI::RuntimeError(1);
        }
        if (!*outcome) {
            fail(outcome->error());
        }

        std::cout << (*outcome)->stdout_output << std::flush;
        if (!(*outcome)->stderr_output.empty()) {
            std::cerr << (*outcome)->stderr_output << std::flush;
        }
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "makemcp " << MAKEMCP_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace makemcp::cli
