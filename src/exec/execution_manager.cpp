#include "makemcp/exec/execution_manager.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <csignal>
#include <variant>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "makemcp/core/logger.hpp"
#include "makemcp/core/utils.hpp"
#include "makemcp/make/target_parser.hpp"
#include "makemcp/security/env_sanitizer.hpp"
#include "makemcp/security/path_guard.hpp"

namespace makemcp::exec {

namespace net = boost::asio;
using namespace boost::asio::experimental::awaitable_operators;

namespace {

constexpr auto kExitPollInterval = std::chrono::milliseconds(10);

enum class ExecutionState {
    Idle,
    Spawned,
    Completed,
    TimedOut,
    Cancelled,
    SpawnFailed,
};

auto state_name(ExecutionState state) -> std::string_view {
    switch (state) {
        case ExecutionState::Idle: return "idle";
        case ExecutionState::Spawned: return "spawned";
        case ExecutionState::Completed: return "completed";
        case ExecutionState::TimedOut: return "timed_out";
        case ExecutionState::Cancelled: return "cancelled";
        case ExecutionState::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

void transition(const std::string& target, ExecutionState& state, ExecutionState next) {
    LOG_DEBUG("make {}: {} -> {}", target, state_name(state), state_name(next));
    state = next;
}

/// Reads a pipe to EOF. Stops quietly on cancellation.
auto drain(net::posix::stream_descriptor& stream, std::string& sink) -> awaitable<void> {
    std::array<char, 8192> buffer{};
    for (;;) {
        auto [ec, n] = co_await stream.async_read_some(
            net::buffer(buffer), net::as_tuple(net::use_awaitable));
        sink.append(buffer.data(), n);
        if (ec) {
            if (ec != net::error::eof && ec != net::error::operation_aborted) {
                LOG_WARN("Output pipe read failed: {}", ec.message());
            }
            co_return;
        }
    }
}

auto wait_for_exit(ChildProcess& child) -> awaitable<int> {
    net::steady_timer poll(co_await net::this_coro::executor);
    for (;;) {
        if (auto code = child.try_wait()) co_return *code;
        poll.expires_after(kExitPollInterval);
        auto [ec] = co_await poll.async_wait(net::as_tuple(net::use_awaitable));
        if (ec) co_return -1;
    }
}

/// True when the deadline expired, false when the wait was cancelled.
auto wait_for_deadline(net::steady_timer& deadline) -> awaitable<bool> {
    auto [ec] = co_await deadline.async_wait(net::as_tuple(net::use_awaitable));
    co_return !ec;
}

/// SIGTERM to the process group, SIGKILL once `grace` has passed. The group
/// is signalled even when make itself has already exited, since recipe
/// processes it left behind may still hold the output pipes.
auto terminate_child(ChildProcess& child, std::chrono::milliseconds grace) -> awaitable<void> {
    if (child.poll_group()) co_return;

    child.signal(SIGTERM);
    net::steady_timer poll(co_await net::this_coro::executor);
    auto give_up = SteadyClock::now() + grace;
    while (SteadyClock::now() < give_up) {
        if (child.poll_group()) co_return;
        poll.expires_after(kExitPollInterval);
        auto [ec] = co_await poll.async_wait(net::as_tuple(net::use_awaitable));
        if (ec) break;
    }

    if (!child.poll_group()) {
        LOG_DEBUG("Process group {} still alive after {}ms, sending SIGKILL",
                  child.pid(), grace.count());
        child.kill_group();
    }
}

} // anonymous namespace

ExecutionManager::ExecutionManager(std::filesystem::path makefile_dir,
                                   ExecutionConfig config,
                                   std::shared_ptr<ProcessLauncher> launcher)
    : makefile_dir_(std::move(makefile_dir))
    , config_(std::move(config))
    , launcher_(launcher ? std::move(launcher) : std::make_shared<PosixProcessLauncher>())
{
}

auto ExecutionManager::clamp_timeout(int requested_seconds) const -> int {
    auto ceiling = std::clamp(config_.max_timeout_seconds, 1, kMaxTimeoutSeconds);
    return std::clamp(requested_seconds, 1, ceiling);
}

auto ExecutionManager::run(ExecutionRequest request) -> awaitable<Result<ExecutionResult>> {
    co_await net::this_coro::throw_if_cancelled(false);

    auto state = ExecutionState::Idle;
    const auto& target = request.target;

    // The target becomes argv[1] of make; anything outside the name
    // grammar could be read as an option or variable assignment.
    if (!make::is_valid_target_name(target)) {
        co_return make_fail(make_error(ErrorCode::InvalidTarget, "Invalid target name", target));
    }

    auto working_dir = security::validate_path(makefile_dir_);
    if (!working_dir) {
        co_return make_fail(working_dir.error());
    }

    auto timeout = clamp_timeout(request.timeout_seconds);
    auto grace = std::chrono::milliseconds(config_.kill_grace_ms);

    SpawnRequest spawn_request{
        .program = config_.make_program,
        .args = {target},
        .working_dir = *working_dir,
        .environment = security::sanitize_environment(
            security::current_environment(), config_.stripped_env_prefixes),
    };

    LOG_INFO("Running make {} in {} (timeout {}s)", target, working_dir->string(), timeout);

    auto child = launcher_->spawn(spawn_request);
    if (!child) {
        transition(target, state, ExecutionState::SpawnFailed);
        co_return make_fail(child.error());
    }
    transition(target, state, ExecutionState::Spawned);

    auto executor = co_await net::this_coro::executor;
    net::posix::stream_descriptor out(executor, child->release_stdout());
    net::posix::stream_descriptor err(executor, child->release_stderr());
    net::steady_timer deadline(executor);
    deadline.expires_after(std::chrono::seconds(timeout));

    ExecutionResult result;
    std::variant<int, bool> outcome;
    bool cancelled = false;
    try {
        outcome = co_await (
            (drain(out, result.stdout_output) &&
             drain(err, result.stderr_output) &&
             wait_for_exit(*child)) ||
            wait_for_deadline(deadline));
    } catch (const boost::system::system_error& e) {
        if (e.code() != net::error::operation_aborted) throw;
        cancelled = true;
    }

    auto cs = co_await net::this_coro::cancellation_state;
    if (cancelled || cs.cancelled() != net::cancellation_type::none) {
        transition(target, state, ExecutionState::Cancelled);
        co_await net::this_coro::reset_cancellation_state();
        co_await terminate_child(*child, grace);
        LOG_INFO("make {} cancelled", target);
        throw boost::system::system_error(net::error::operation_aborted);
    }

    if (outcome.index() == 1) {
        transition(target, state, ExecutionState::TimedOut);
        co_await terminate_child(*child, grace);
        LOG_WARN("make {} exceeded {}s timeout", target, timeout);
        co_return make_fail(make_error(ErrorCode::ExecutionTimeout,
            "Target execution exceeded " + std::to_string(timeout) + "s timeout", target));
    }

    transition(target, state, ExecutionState::Completed);
    result.exit_code = std::get<0>(outcome);

    if (result.exit_code != 0) {
        LOG_INFO("make {} failed with exit code {}", target, result.exit_code);
        co_return make_fail(make_error(ErrorCode::TargetExecutionFailed,
            "Target execution failed with exit code " + std::to_string(result.exit_code),
            utils::trim(result.stderr_output)));
    }

    LOG_INFO("make {} completed ({} bytes stdout)", target, result.stdout_output.size());
    co_return result;
}

} // namespace makemcp::exec
