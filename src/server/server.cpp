#include "makemcp/server/server.hpp"

#include <cerrno>
#include <cstring>
#include <iostream>

#include <unistd.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "makemcp/core/logger.hpp"
#include "makemcp/core/utils.hpp"
#include "makemcp/core/version.hpp"
#include "makemcp/make/makefile.hpp"
#include "makemcp/tools/make_tools.hpp"

namespace makemcp::server {

namespace net = boost::asio;

namespace {

constexpr std::size_t kMaxLineBytes = 16 * 1024 * 1024;

void write_stdout(std::string_view frame) {
    std::cout << frame << '\n' << std::flush;
}

} // anonymous namespace

McpServer::McpServer(net::io_context& ioc,
                     ServerConfig config,
                     std::shared_ptr<exec::ProcessLauncher> launcher)
    : ioc_(ioc)
    , config_(std::move(config))
    , catalog_(config_.makefile_dir)
    , executor_(config_.makefile_dir, config_.execution, std::move(launcher))
    , writer_(write_stdout)
{
    tools::register_make_tools(tools_, catalog_, executor_);
    register_mcp_handlers(protocol_, catalog_, tools_,
                          ServerInfo{.name = "makemcp", .version = kVersion});
}

McpServer::~McpServer() {
    cancel_all();
}

auto McpServer::check_makefile() const -> VoidResult {
    auto path = make::locate_makefile(config_.makefile_dir);
    if (!path) return std::unexpected(path.error());
    LOG_INFO("Serving {}", path->string());
    return {};
}

void McpServer::set_writer(Writer writer) {
    writer_ = std::move(writer);
}

void McpServer::write_frame(const ResponseFrame& frame) {
    writer_(serialize_frame(frame));
}

// ---------------------------------------------------------------------------
// Inbound frames
// ---------------------------------------------------------------------------

void McpServer::handle_line(std::string_view line) {
    auto text = utils::trim(line);
    if (text.empty()) return;

    auto frame = parse_frame(text);
    if (!frame) {
        LOG_WARN("Rejected frame: {}", frame.error().what());
        write_frame(make_error_response(nullptr, frame.error()));
        return;
    }

    if (auto* response = std::get_if<ResponseFrame>(&*frame)) {
        LOG_DEBUG("Ignoring client response for id {}", response->id.dump());
        return;
    }

    auto& request = std::get<RequestFrame>(*frame);
    if (request.is_notification()) {
        handle_notification(request);
        return;
    }
    start_request(std::move(request));
}

void McpServer::handle_notification(const RequestFrame& request) {
    if (request.method == "notifications/cancelled") {
        const auto& params = request.params;
        if (params.is_object() && params.contains("requestId")) {
            if (!cancel_request(params["requestId"])) {
                LOG_DEBUG("Cancel for unknown request {}", params["requestId"].dump());
            }
        }
        return;
    }

    if (!protocol_.has_method(request.method)) {
        LOG_DEBUG("Ignoring notification {}", request.method);
        return;
    }

    net::co_spawn(ioc_, [this, request]() -> awaitable<void> {
        RequestContext ctx{session_, nullptr, request.method};
        auto result = co_await protocol_.dispatch(ctx, request);
        if (!result) {
            LOG_WARN("Notification {} failed: {}", request.method, result.error().what());
        }
    }, net::detached);
}

void McpServer::start_request(RequestFrame request) {
    auto key = request.id->dump();
    if (in_flight_.contains(key)) {
        write_frame(make_error_response(*request.id,
            make_error(ErrorCode::ProtocolError, "Invalid Request", "duplicate id " + key)));
        return;
    }

    auto signal = std::make_shared<net::cancellation_signal>();
    in_flight_.emplace(key, signal);

    net::co_spawn(ioc_, process_request(std::move(request)),
        net::bind_cancellation_slot(signal->slot(),
            [this, key, signal](std::exception_ptr ep) {
                in_flight_.erase(key);
                if (!ep) return;
                try {
                    std::rethrow_exception(ep);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == net::error::operation_aborted) {
                        LOG_INFO("Request {} cancelled", key);
                        return;
                    }
                    LOG_ERROR("Request {} failed: {}", key, e.what());
                } catch (const std::exception& e) {
                    LOG_ERROR("Request {} failed: {}", key, e.what());
                }
            }));
}

auto McpServer::process_request(RequestFrame request) -> awaitable<void> {
    RequestContext ctx{session_, *request.id, request.method};
    LOG_DEBUG("-> {} (id {})", request.method, ctx.id.dump());

    auto result = co_await protocol_.dispatch(ctx, request);

    auto cs = co_await net::this_coro::cancellation_state;
    if (cs.cancelled() != net::cancellation_type::none) {
        LOG_DEBUG("Dropping response for cancelled request {}", ctx.id.dump());
        co_return;
    }

    if (result) {
        write_frame(make_response(ctx.id, std::move(*result)));
    } else {
        LOG_DEBUG("<- {} error: {}", request.method, result.error().what());
        write_frame(make_error_response(ctx.id, result.error()));
    }
}

// ---------------------------------------------------------------------------
// Cancellation
// ---------------------------------------------------------------------------

auto McpServer::cancel_request(const json& id) -> bool {
    auto it = in_flight_.find(id.dump());
    if (it == in_flight_.end()) return false;
    LOG_INFO("Cancelling request {}", it->first);
    // Keep the signal alive across emit(); the completion handler erases
    // the map entry.
    auto signal = it->second;
    signal->emit(net::cancellation_type::terminal);
    return true;
}

void McpServer::cancel_all() {
    std::vector<std::shared_ptr<net::cancellation_signal>> signals;
    signals.reserve(in_flight_.size());
    for (const auto& [_, signal] : in_flight_) {
        signals.push_back(signal);
    }
    for (auto& signal : signals) {
        signal->emit(net::cancellation_type::terminal);
    }
}

// ---------------------------------------------------------------------------
// stdio transport
// ---------------------------------------------------------------------------

auto McpServer::run_stdio() -> awaitable<void> {
    int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        LOG_ERROR("Cannot duplicate stdin: {}", std::strerror(errno));
        co_return;
    }
    input_ = std::make_unique<net::posix::stream_descriptor>(ioc_, fd);

    LOG_INFO("Listening on stdio");
    std::string buffer;
    for (;;) {
        auto [ec, n] = co_await net::async_read_until(
            *input_, net::dynamic_buffer(buffer, kMaxLineBytes), '\n',
            net::as_tuple(net::use_awaitable));

        if (ec) {
            if (ec == net::error::eof) {
                if (!buffer.empty()) handle_line(buffer);
                LOG_INFO("stdin closed");
            } else if (ec == net::error::operation_aborted) {
                LOG_INFO("stdin reader stopped");
            } else {
                LOG_ERROR("stdin read failed: {}", ec.message());
            }
            break;
        }

        std::string line = buffer.substr(0, n);
        buffer.erase(0, n);
        handle_line(line);
    }

    input_.reset();
    cancel_all();
}

void McpServer::shutdown() {
    LOG_INFO("Shutting down ({} requests in flight)", in_flight_.size());
    if (input_) {
        boost::system::error_code ec;
        input_->cancel(ec);
    }
    cancel_all();
}

} // namespace makemcp::server
