#include "makemcp/server/handlers.hpp"

#include <algorithm>

#include "makemcp/core/logger.hpp"

namespace makemcp::server {

namespace {

auto invalid_params(std::string detail) -> Error {
    return make_error(ErrorCode::InvalidArgument, "Invalid params", std::move(detail));
}

auto negotiate_version(const json& params) -> std::string {
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        auto requested = params["protocolVersion"].get<std::string>();
        const auto& supported = supported_protocol_versions();
        if (std::ranges::find(supported, requested) != supported.end()) {
            return requested;
        }
        LOG_INFO("Client requested protocol {}, offering {}", requested, kLatestProtocolVersion);
    }
    return std::string(kLatestProtocolVersion);
}

} // anonymous namespace

auto supported_protocol_versions() -> const std::vector<std::string>& {
    static const std::vector<std::string> versions = {
        std::string(kLatestProtocolVersion), "2025-03-26", "2024-11-05",
    };
    return versions;
}

auto make_tool_result(const Result<std::string>& outcome) -> json {
    auto text = outcome ? *outcome : outcome.error().what();
    return json{
        {"content", json::array({json{{"type", "text"}, {"text", text}}})},
        {"isError", !outcome.has_value()},
    };
}

void register_mcp_handlers(Protocol& protocol,
                           const resources::ResourceCatalog& catalog,
                           tools::ToolRegistry& registry,
                           ServerInfo info) {
    // -- Lifecycle --

    protocol.register_method("initialize",
        [info](RequestContext& ctx, json params) -> awaitable<Result<json>> {
            auto& session = ctx.session;
            if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
                const auto& client = params["clientInfo"];
                if (client.contains("name") && client["name"].is_string()) {
                    session.client_name = client["name"].get<std::string>();
                }
                if (client.contains("version") && client["version"].is_string()) {
                    session.client_version = client["version"].get<std::string>();
                }
            }
            session.protocol_version = negotiate_version(params);
            LOG_INFO("Session initialized by {} {} (protocol {})",
                     session.client_name.value_or("unknown client"),
                     session.client_version.value_or(""),
                     session.protocol_version);

            co_return json{
                {"protocolVersion", session.protocol_version},
                {"capabilities", {
                    {"resources", json::object()},
                    {"tools", json::object()},
                }},
                {"serverInfo", {
                    {"name", info.name},
                    {"version", info.version},
                }},
            };
        },
        "Negotiate protocol version and capabilities");

    protocol.register_method("notifications/initialized",
        [](RequestContext& ctx, json) -> awaitable<Result<json>> {
            ctx.session.initialized = true;
            co_return json(nullptr);
        },
        "Client finished initialization");

    protocol.register_method("ping",
        [](RequestContext&, json) -> awaitable<Result<json>> {
            co_return json::object();
        },
        "Liveness check");

    // -- Resources --

    protocol.register_method("resources/list",
        [&catalog](RequestContext&, json) -> awaitable<Result<json>> {
            co_return json{{"resources", catalog.list_resources()}};
        },
        "List make:// resources");

    protocol.register_method("resources/read",
        [&catalog](RequestContext&, json params) -> awaitable<Result<json>> {
            if (!params.contains("uri") || !params["uri"].is_string()) {
                co_return make_fail(invalid_params("uri must be a string"));
            }
            auto content = catalog.read_resource(params["uri"].get<std::string>());
            if (!content) {
                co_return make_fail(content.error());
            }
            co_return json{{"contents", json::array({*content})}};
        },
        "Read a make:// resource");

    // -- Tools --

    protocol.register_method("tools/list",
        [&registry](RequestContext&, json) -> awaitable<Result<json>> {
            json tools = json::array();
            for (const auto& def : registry.list()) {
                tools.push_back(def.to_json());
            }
            co_return json{{"tools", tools}};
        },
        "List callable tools");

    protocol.register_method("tools/call",
        [&registry](RequestContext& ctx, json params) -> awaitable<Result<json>> {
            if (!params.contains("name") || !params["name"].is_string()) {
                co_return make_fail(invalid_params("name must be a string"));
            }
            auto name = params["name"].get<std::string>();

            json arguments = json::object();
            if (params.contains("arguments") && !params["arguments"].is_null()) {
                if (!params["arguments"].is_object()) {
                    co_return make_fail(invalid_params("arguments must be an object"));
                }
                arguments = params["arguments"];
            }

            LOG_INFO("tools/call {} (request {})", name, ctx.id.dump());
            auto outcome = co_await registry.execute(name, std::move(arguments));
            if (!outcome) {
                LOG_WARN("Tool {} failed: {}", name, outcome.error().what());
            }
            co_return make_tool_result(outcome);
        },
        "Invoke a tool");
}

} // namespace makemcp::server
