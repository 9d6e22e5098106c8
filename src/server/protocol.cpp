#include "makemcp/server/protocol.hpp"

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "makemcp/core/logger.hpp"

namespace makemcp::server {

void Protocol::register_method(std::string name, MethodHandler handler,
                               std::string description) {
    LOG_DEBUG("Registering method: {}", name);
    methods_[name] = Entry{
        .handler = std::move(handler),
        .info = MethodInfo{
            .name = name,
            .description = std::move(description),
        },
    };
}

auto Protocol::has_method(std::string_view name) const -> bool {
    return methods_.contains(std::string(name));
}

auto Protocol::methods() const -> std::vector<MethodInfo> {
    std::vector<MethodInfo> result;
    result.reserve(methods_.size());
    for (const auto& [_, entry] : methods_) {
        result.push_back(entry.info);
    }
    return result;
}

auto Protocol::dispatch(RequestContext& ctx, const RequestFrame& request)
    -> awaitable<Result<json>> {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        co_return make_fail(
            make_error(ErrorCode::MethodNotFound,
                       "Method not found", request.method));
    }

    try {
        co_return co_await it->second.handler(ctx, request.params);
    } catch (const boost::system::system_error& e) {
        if (e.code() == boost::asio::error::operation_aborted) throw;
        LOG_ERROR("Method {} failed: {}", request.method, e.what());
        co_return make_fail(
            make_error(ErrorCode::InternalError,
                       "Method execution failed", e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("Method {} threw exception: {}", request.method, e.what());
        co_return make_fail(
            make_error(ErrorCode::InternalError,
                       "Method execution failed", e.what()));
    }
}

} // namespace makemcp::server
