#include "makemcp/exec/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "makemcp/core/logger.hpp"

namespace makemcp::exec {

namespace {

void close_fd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

auto decode_status(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

auto spawn_error(const std::string& program, int err) -> Error {
    return make_error(ErrorCode::SpawnFailure,
        "Failed to start " + program, std::string(std::strerror(err)));
}

/// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const char* program,
                             char* const* argv,
                             char* const* envp,
                             const char* working_dir,
                             int devnull, int out_fd, int err_fd, int status_fd) {
    ::setpgid(0, 0);

    sigset_t all;
    sigemptyset(&all);
    ::sigprocmask(SIG_SETMASK, &all, nullptr);
    ::signal(SIGPIPE, SIG_DFL);

    if (::dup2(devnull, STDIN_FILENO) < 0 ||
        ::dup2(out_fd, STDOUT_FILENO) < 0 ||
        ::dup2(err_fd, STDERR_FILENO) < 0) {
        int err = errno;
        [[maybe_unused]] auto n = ::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }

    if (::chdir(working_dir) != 0) {
        int err = errno;
        [[maybe_unused]] auto n = ::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvpe(program, argv, envp);

    int err = errno;
    [[maybe_unused]] auto n = ::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ChildProcess
// ---------------------------------------------------------------------------

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

ChildProcess::~ChildProcess() {
    reset();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , stdout_fd_(std::exchange(other.stdout_fd_, -1))
    , stderr_fd_(std::exchange(other.stderr_fd_, -1))
    , exit_code_(std::exchange(other.exit_code_, std::nullopt)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        reset();
        pid_ = std::exchange(other.pid_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        exit_code_ = std::exchange(other.exit_code_, std::nullopt);
    }
    return *this;
}

void ChildProcess::reset() noexcept {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    if (pid_ > 0 && !poll_group()) {
        if (exit_code_) {
            LOG_DEBUG("Killing leftover processes in group {}", pid_);
        } else {
            LOG_WARN("Killing unreaped child process group {}", pid_);
        }
        kill_group();
    }
    pid_ = -1;
    exit_code_.reset();
}

auto ChildProcess::release_stdout() noexcept -> int {
    return std::exchange(stdout_fd_, -1);
}

auto ChildProcess::release_stderr() noexcept -> int {
    return std::exchange(stderr_fd_, -1);
}

auto ChildProcess::try_wait() -> std::optional<int> {
    if (exit_code_ || pid_ <= 0) return exit_code_;

    int status = 0;
    auto rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        exit_code_ = decode_status(status);
    } else if (rc < 0 && errno != EINTR) {
        LOG_ERROR("waitpid({}) failed: {}", pid_, std::strerror(errno));
        exit_code_ = -1;
    }
    return exit_code_;
}

auto ChildProcess::wait() -> int {
    if (exit_code_ || pid_ <= 0) return exit_code_.value_or(-1);

    int status = 0;
    pid_t rc;
    while ((rc = ::waitpid(pid_, &status, 0)) < 0 && errno == EINTR) {}
    exit_code_ = rc == pid_ ? decode_status(status) : -1;
    return *exit_code_;
}

auto ChildProcess::group_alive() const noexcept -> bool {
    if (pid_ <= 0) return false;
    // EPERM still means the group exists.
    return ::kill(-pid_, 0) == 0 || errno == EPERM;
}

auto ChildProcess::poll_group() -> bool {
    if (pid_ <= 0) return true;
    try_wait();
    while (::waitpid(-pid_, nullptr, WNOHANG) > 0) {}
    return exit_code_.has_value() && !group_alive();
}

void ChildProcess::signal(int sig) noexcept {
    if (pid_ > 0) {
        ::kill(-pid_, sig);
    }
}

void ChildProcess::kill_group() {
    if (pid_ <= 0) return;
    signal(SIGKILL);
    wait();
    // Members orphaned by their parents' deaths are re-parented to us and
    // can be waited for; ECHILD means none are left.
    for (;;) {
        auto rc = ::waitpid(-pid_, nullptr, 0);
        if (rc > 0 || (rc < 0 && errno == EINTR)) continue;
        break;
    }
}

void ChildProcess::terminate(std::chrono::milliseconds grace) {
    if (poll_group()) return;

    signal(SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (poll_group()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    LOG_DEBUG("Process group {} ignored SIGTERM, sending SIGKILL", pid_);
    kill_group();
}

// ---------------------------------------------------------------------------
// PosixProcessLauncher
// ---------------------------------------------------------------------------

PosixProcessLauncher::PosixProcessLauncher() {
    if (::prctl(PR_SET_CHILD_SUBREAPER, 1) != 0) {
        LOG_WARN("Cannot become child subreaper: {}", std::strerror(errno));
    }
}

auto PosixProcessLauncher::spawn(const SpawnRequest& request) -> Result<ChildProcess> {
    // Everything the child touches is prepared before fork().
    std::vector<std::string> env_strings = security::to_envp(request.environment);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::string program = request.program;
    std::vector<std::string> arg_strings;
    arg_strings.reserve(request.args.size() + 1);
    arg_strings.push_back(program);
    arg_strings.insert(arg_strings.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    argv.reserve(arg_strings.size() + 1);
    for (auto& s : arg_strings) argv.push_back(s.data());
    argv.push_back(nullptr);

    std::string working_dir = request.working_dir.string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    int devnull = -1;

    auto cleanup = [&] {
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1], &devnull}) {
            close_fd(*fd);
        }
    };

    if (::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        cleanup();
        return std::unexpected(spawn_error(program, err));
    }

    devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        int err = errno;
        cleanup();
        return std::unexpected(spawn_error(program, err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        cleanup();
        return std::unexpected(spawn_error(program, err));
    }

    if (pid == 0) {
        exec_child(program.c_str(), argv.data(), envp.data(), working_dir.c_str(),
                   devnull, out_pipe[1], err_pipe[1], status_pipe[1]);
    }

    // Parent. Mirror the child's setpgid so a signal sent right away still
    // reaches the group.
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);
    close_fd(devnull);

    // The status pipe closes on a successful exec; otherwise the child
    // reports errno through it before exiting.
    int child_errno = 0;
    ssize_t n;
    while ((n = ::read(status_pipe[0], &child_errno, sizeof(child_errno))) < 0 &&
           errno == EINTR) {}
    close_fd(status_pipe[0]);

    ChildProcess child(pid, std::exchange(out_pipe[0], -1), std::exchange(err_pipe[0], -1));

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        child.wait();
        LOG_DEBUG("exec of {} in {} failed: {}", program, working_dir, std::strerror(child_errno));
        return std::unexpected(spawn_error(program, child_errno));
    }

    LOG_DEBUG("Spawned {} (pid {}) in {}", program, pid, working_dir);
    return child;
}

} // namespace makemcp::exec
