#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <boost/asio/awaitable.hpp>

#include "makemcp/core/config.hpp"
#include "makemcp/core/error.hpp"
#include "makemcp/exec/process.hpp"

namespace makemcp::exec {

using boost::asio::awaitable;

struct ExecutionRequest {
    std::string target;
    int timeout_seconds = kDefaultTimeoutSeconds;
};

struct ExecutionResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;
};

/// Runs `make <target>` in the Makefile directory under a deadline.
///
/// Each run validates the target name before anything is spawned, hands the
/// child a sanitized environment and the validated directory as its working
/// directory, drains stdout and stderr concurrently and terminates the
/// child's process group on timeout or cancellation. The server's own
/// working directory is never changed, so runs may overlap.
class ExecutionManager {
public:
    ExecutionManager(std::filesystem::path makefile_dir,
                     ExecutionConfig config,
                     std::shared_ptr<ProcessLauncher> launcher = nullptr);

    /// Completes with the captured output on exit code 0, or fails with
    /// InvalidTarget, SecurityViolation, SpawnFailure, ExecutionTimeout or
    /// TargetExecutionFailed. Terminal cancellation of the awaiting
    /// coroutine kills the child and rethrows operation_aborted.
    auto run(ExecutionRequest request) -> awaitable<Result<ExecutionResult>>;

    /// Clamps a requested timeout to [1, configured ceiling].
    [[nodiscard]] auto clamp_timeout(int requested_seconds) const -> int;

    [[nodiscard]] auto makefile_dir() const -> const std::filesystem::path& { return makefile_dir_; }
    [[nodiscard]] auto config() const -> const ExecutionConfig& { return config_; }

private:
    std::filesystem::path makefile_dir_;
    ExecutionConfig config_;
    std::shared_ptr<ProcessLauncher> launcher_;
};

} // namespace makemcp::exec
