#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "makemcp/core/error.hpp"
#include "makemcp/core/types.hpp"

namespace makemcp::server {

inline constexpr std::string_view kJsonRpcVersion = "2.0";

/// JSON-RPC 2.0 request or notification (no id).
struct RequestFrame {
    std::optional<json> id;
    std::string method;
    json params = json::object();

    [[nodiscard]] auto is_notification() const noexcept -> bool { return !id.has_value(); }
};

void to_json(json& j, const RequestFrame& f);
void from_json(const json& j, RequestFrame& f);

/// JSON-RPC 2.0 response. Exactly one of result/error is set.
struct ResponseFrame {
    json id;
    std::optional<json> result;
    std::optional<json> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);
void from_json(const json& j, ResponseFrame& f);

using Frame = std::variant<RequestFrame, ResponseFrame>;

/// Parses one line of input. Malformed JSON fails with SerializationError,
/// a well-formed message that is not a valid JSON-RPC frame with
/// ProtocolError.
auto parse_frame(std::string_view data) -> Result<Frame>;

auto serialize_frame(const ResponseFrame& frame) -> std::string;

/// JSON-RPC error code for an internal error code.
[[nodiscard]] auto rpc_error_code(ErrorCode code) -> int;

auto make_response(json id, json result) -> ResponseFrame;
auto make_error_response(json id, const Error& error) -> ResponseFrame;

} // namespace makemcp::server
