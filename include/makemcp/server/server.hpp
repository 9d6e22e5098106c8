#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

#include "makemcp/core/config.hpp"
#include "makemcp/core/error.hpp"
#include "makemcp/exec/execution_manager.hpp"
#include "makemcp/resources/resource_catalog.hpp"
#include "makemcp/server/handlers.hpp"
#include "makemcp/server/protocol.hpp"
#include "makemcp/tools/tool_registry.hpp"

namespace makemcp::server {

struct ServerConfig {
    std::filesystem::path makefile_dir;
    ExecutionConfig execution;
};

/// MCP server over newline-delimited JSON-RPC.
///
/// Every request runs as its own coroutine with its own cancellation
/// signal, so a slow `tools/call` does not hold up `ping` or a
/// `notifications/cancelled` aimed at it.
class McpServer {
public:
    /// Receives one serialized frame, without the trailing newline.
    using Writer = std::function<void(std::string_view)>;

    McpServer(boost::asio::io_context& ioc,
              ServerConfig config,
              std::shared_ptr<exec::ProcessLauncher> launcher = nullptr);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Fails with MakefileNotFound (or SecurityViolation) when the
    /// configured directory cannot be served.
    [[nodiscard]] auto check_makefile() const -> VoidResult;

    /// Replaces the stdout writer.
    void set_writer(Writer writer);

    /// Handles one inbound line. Responses are written when the request
    /// completes; this call itself never blocks on a request.
    void handle_line(std::string_view line);

    /// Reads stdin until EOF or shutdown(), then cancels what is still
    /// in flight.
    auto run_stdio() -> awaitable<void>;

    /// Stops reading and cancels every in-flight request.
    void shutdown();

    /// Emits terminal cancellation for one in-flight request.
    auto cancel_request(const json& id) -> bool;
    void cancel_all();

    [[nodiscard]] auto in_flight() const noexcept -> std::size_t { return in_flight_.size(); }
    [[nodiscard]] auto session() const noexcept -> const Session& { return session_; }
    [[nodiscard]] auto protocol() noexcept -> Protocol& { return protocol_; }

private:
    void write_frame(const ResponseFrame& frame);
    void start_request(RequestFrame request);
    void handle_notification(const RequestFrame& request);
    auto process_request(RequestFrame request) -> awaitable<void>;

    boost::asio::io_context& ioc_;
    ServerConfig config_;
    resources::ResourceCatalog catalog_;
    exec::ExecutionManager executor_;
    tools::ToolRegistry tools_;
    Protocol protocol_;
    Session session_;
    Writer writer_;
    std::unique_ptr<boost::asio::posix::stream_descriptor> input_;
    std::unordered_map<std::string, std::shared_ptr<boost::asio::cancellation_signal>> in_flight_;
};

} // namespace makemcp::server
