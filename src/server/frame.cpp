#include "makemcp/server/frame.hpp"

namespace makemcp::server {

namespace {

auto valid_id(const json& id) -> bool {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned() || id.is_null();
}

} // anonymous namespace

// -- RequestFrame serialization --

void to_json(json& j, const RequestFrame& f) {
    j = json{
        {"jsonrpc", kJsonRpcVersion},
        {"method", f.method},
        {"params", f.params},
    };
    if (f.id) j["id"] = *f.id;
}

void from_json(const json& j, RequestFrame& f) {
    j.at("method").get_to(f.method);
    if (j.contains("id")) {
        f.id = j.at("id");
    } else {
        f.id.reset();
    }
    if (j.contains("params") && !j.at("params").is_null()) {
        f.params = j.at("params");
    } else {
        f.params = json::object();
    }
}

// -- ResponseFrame serialization --

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", f.id},
    };
    if (f.error) {
        j["error"] = *f.error;
    } else {
        j["result"] = f.result.value_or(json::object());
    }
}

void from_json(const json& j, ResponseFrame& f) {
    f.id = j.value("id", json());
    if (j.contains("result")) f.result = j.at("result");
    if (j.contains("error")) f.error = j.at("error");
}

// -- Frame parsing --

auto parse_frame(std::string_view data) -> Result<Frame> {
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Parse error", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Invalid Request", "message must be a JSON object"));
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() ||
        version->get_ref<const std::string&>() != kJsonRpcVersion) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Invalid Request", "jsonrpc must be \"2.0\""));
    }

    if (j.contains("id") && !valid_id(j["id"])) {
        return std::unexpected(
            make_error(ErrorCode::ProtocolError,
                       "Invalid Request", "id must be a string, integer or null"));
    }

    try {
        if (j.contains("method")) {
            if (!j["method"].is_string()) {
                return std::unexpected(
                    make_error(ErrorCode::ProtocolError,
                               "Invalid Request", "method must be a string"));
            }
            RequestFrame f;
            from_json(j, f);
            if (!f.params.is_object() && !f.params.is_array()) {
                return std::unexpected(
                    make_error(ErrorCode::ProtocolError,
                               "Invalid Request", "params must be structured"));
            }
            return Frame{std::move(f)};
        }
        if (j.contains("id") && (j.contains("result") || j.contains("error"))) {
            ResponseFrame f;
            from_json(j, f);
            return Frame{std::move(f)};
        }
    } catch (const json::exception& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Failed to deserialize frame fields", e.what()));
    }

    return std::unexpected(
        make_error(ErrorCode::ProtocolError,
                   "Invalid Request", "neither a request nor a response"));
}

auto serialize_frame(const ResponseFrame& frame) -> std::string {
    json j = frame;
    return j.dump();
}

auto rpc_error_code(ErrorCode code) -> int {
    switch (code) {
        case ErrorCode::SerializationError: return -32700;
        case ErrorCode::ProtocolError: return -32600;
        case ErrorCode::MethodNotFound: return -32601;
        case ErrorCode::InvalidArgument: return -32602;
        default: return -32603;
    }
}

// -- Factory helpers --

auto make_response(json id, json result) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::move(result),
        .error = std::nullopt,
    };
}

auto make_error_response(json id, const Error& error) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::nullopt,
        .error = json{
            {"code", rpc_error_code(error.code())},
            {"message", error.what()},
            {"data", {{"kind", std::string(error_code_to_string(error.code()))}}},
        },
    };
}

} // namespace makemcp::server
