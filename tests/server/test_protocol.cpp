#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "makemcp/server/handlers.hpp"
#include "makemcp/server/protocol.hpp"
#include "test_support.hpp"

using namespace makemcp::server;
using makemcp::ErrorCode;
using makemcp::json;
using makemcp::testing::run_sync;

namespace {

auto request(std::string method, json params = json::object()) -> RequestFrame {
    return RequestFrame{.id = json(1), .method = std::move(method), .params = std::move(params)};
}

} // anonymous namespace

TEST_CASE("Protocol registers and looks up methods", "[server][protocol]") {
    Protocol proto;
    proto.register_method("test/echo",
        [](RequestContext&, json params) -> awaitable<makemcp::Result<json>> {
            co_return params;
        },
        "Echo back params");

    CHECK(proto.has_method("test/echo"));
    CHECK_FALSE(proto.has_method("test/missing"));

    auto methods = proto.methods();
    REQUIRE(methods.size() == 1);
    CHECK(methods[0].name == "test/echo");
    CHECK(methods[0].description == "Echo back params");
}

TEST_CASE("Protocol dispatches to handlers", "[server][protocol]") {
    Protocol proto;
    Session session;

    proto.register_method("test/echo",
        [](RequestContext& ctx, json params) -> awaitable<makemcp::Result<json>> {
            ctx.session.initialized = true;
            co_return json{{"method", ctx.method}, {"params", params}};
        });

    proto.register_method("test/throws",
        [](RequestContext&, json) -> awaitable<makemcp::Result<json>> {
            throw std::runtime_error("boom");
            co_return json{};
        });

    proto.register_method("test/aborted",
        [](RequestContext&, json) -> awaitable<makemcp::Result<json>> {
            throw boost::system::system_error(boost::asio::error::operation_aborted);
            co_return json{};
        });

    SECTION("known method") {
        RequestContext ctx{session, json(1), "test/echo"};
        auto result = run_sync(proto.dispatch(ctx, request("test/echo", json{{"a", 1}})));
        REQUIRE(result.has_value());
        CHECK((*result)["method"] == "test/echo");
        CHECK((*result)["params"]["a"] == 1);
        CHECK(session.initialized);
    }

    SECTION("unknown method") {
        RequestContext ctx{session, json(2), "nope"};
        auto result = run_sync(proto.dispatch(ctx, request("nope")));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::MethodNotFound);
        CHECK(result.error().what() == "Method not found: nope");
    }

    SECTION("handler exceptions become internal errors") {
        RequestContext ctx{session, json(3), "test/throws"};
        auto result = run_sync(proto.dispatch(ctx, request("test/throws")));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InternalError);
        CHECK(result.error().detail() == "boom");
    }

    SECTION("cancellation propagates") {
        RequestContext ctx{session, json(4), "test/aborted"};
        CHECK_THROWS_AS(run_sync(proto.dispatch(ctx, request("test/aborted"))),
                        boost::system::system_error);
    }
}

TEST_CASE("make_tool_result renders MCP tool output", "[server][protocol]") {
    SECTION("success") {
        auto j = make_tool_result(makemcp::Result<std::string>("built\n"));
        CHECK(j["isError"] == false);
        REQUIRE(j["content"].size() == 1);
        CHECK(j["content"][0]["type"] == "text");
        CHECK(j["content"][0]["text"] == "built\n");
    }

    SECTION("failure") {
        makemcp::Result<std::string> failed = std::unexpected(
            makemcp::make_error(ErrorCode::ExecutionTimeout, "Target execution exceeded 1s timeout"));
        auto j = make_tool_result(failed);
        CHECK(j["isError"] == true);
        CHECK(j["content"][0]["text"] == "Target execution exceeded 1s timeout");
    }
}

TEST_CASE("supported_protocol_versions starts with the latest", "[server][protocol]") {
    const auto& versions = supported_protocol_versions();
    REQUIRE_FALSE(versions.empty());
    CHECK(versions.front() == kLatestProtocolVersion);
}
