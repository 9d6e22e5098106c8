#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "makemcp/core/error.hpp"
#include "makemcp/security/env_sanitizer.hpp"

namespace makemcp::exec {

struct SpawnRequest {
    std::string program;
    std::vector<std::string> args;        // excluding argv[0]
    std::filesystem::path working_dir;    // child chdirs here before exec
    security::Environment environment;    // complete child environment
};

/// Owns a spawned child and its output pipes.
///
/// The child runs in its own process group so signals reach everything it
/// started. The group id is the child's pid and outlives the child itself:
/// a recipe that backgrounds a process leaves the group populated after the
/// leader exits. Destroying a ChildProcess kills whatever is left in the
/// group and reaps it.
class ChildProcess {
public:
    ChildProcess() = default;
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }
    [[nodiscard]] auto reaped() const noexcept -> bool { return exit_code_.has_value(); }
    [[nodiscard]] auto exit_code() const noexcept -> std::optional<int> { return exit_code_; }

    /// Transfers ownership of the read end; returns -1 once taken.
    auto release_stdout() noexcept -> int;
    auto release_stderr() noexcept -> int;

    /// Non-blocking reap. Returns the exit code once the child has exited;
    /// death by signal N is reported as 128 + N.
    auto try_wait() -> std::optional<int>;

    /// Blocking reap.
    auto wait() -> int;

    /// True while any process (zombies included) remains in the group.
    [[nodiscard]] auto group_alive() const noexcept -> bool;

    /// Non-blocking reap of the leader and of group members re-parented to
    /// this process. True once the group is empty.
    auto poll_group() -> bool;

    /// Sends `sig` to the child's process group, whether or not the leader
    /// has been reaped.
    void signal(int sig) noexcept;

    /// SIGKILL to the group, then a blocking reap of everything in it.
    void kill_group();

    /// SIGTERM, up to `grace` for the group to exit, then SIGKILL. Blocks.
    void terminate(std::chrono::milliseconds grace);

private:
    void reset() noexcept;

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_code_;
};

/// Starts child processes. ExecutionManager depends on this seam only.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /// Fails with SpawnFailure if the program cannot be started, including a
    /// working directory the child cannot enter.
    virtual auto spawn(const SpawnRequest& request) -> Result<ChildProcess> = 0;
};

/// fork + execvpe launcher. No shell is involved: `args` reach the program
/// verbatim. The program is looked up on the server's own PATH, stdin is
/// /dev/null.
///
/// The launching process becomes a child subreaper, so members of a child's
/// group orphaned by the leader's exit can be reaped here instead of by init.
class PosixProcessLauncher final : public ProcessLauncher {
public:
    PosixProcessLauncher();

    auto spawn(const SpawnRequest& request) -> Result<ChildProcess> override;
};

} // namespace makemcp::exec
