#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "makemcp/core/error.hpp"
#include "makemcp/core/types.hpp"
#include "makemcp/server/frame.hpp"

namespace makemcp::server {

using boost::asio::awaitable;

/// Per-connection state established by `initialize`.
struct Session {
    std::optional<std::string> client_name;
    std::optional<std::string> client_version;
    std::string protocol_version;
    bool initialized = false;
};

/// Handed explicitly to every method handler.
struct RequestContext {
    Session& session;
    json id;              // null for notifications
    std::string method;
};

using MethodHandler = std::function<awaitable<Result<json>>(RequestContext& ctx, json params)>;

struct MethodInfo {
    std::string name;
    std::string description;
};

/// Method registration and dispatch for JSON-RPC requests.
class Protocol {
public:
    Protocol() = default;

    void register_method(std::string name, MethodHandler handler,
                         std::string description = "");

    [[nodiscard]] auto has_method(std::string_view name) const -> bool;
    [[nodiscard]] auto methods() const -> std::vector<MethodInfo>;

    /// Fails with MethodNotFound for unregistered methods. Exceptions from
    /// handlers become InternalError, except cancellation, which propagates.
    auto dispatch(RequestContext& ctx, const RequestFrame& request) -> awaitable<Result<json>>;

private:
    struct Entry {
        MethodHandler handler;
        MethodInfo info;
    };

    std::unordered_map<std::string, Entry> methods_;
};

} // namespace makemcp::server
