#pragma once

#include <string>

#include "makemcp/resources/resource_catalog.hpp"
#include "makemcp/server/protocol.hpp"
#include "makemcp/tools/tool_registry.hpp"

namespace makemcp::server {

inline constexpr std::string_view kLatestProtocolVersion = "2025-06-18";

/// Protocol revisions the server can speak, newest first.
[[nodiscard]] auto supported_protocol_versions() -> const std::vector<std::string>&;

struct ServerInfo {
    std::string name = "makemcp";
    std::string version;
};

/// Registers initialize, ping, resources/* and tools/* on `protocol`.
/// The referenced catalog and registry must outlive it.
void register_mcp_handlers(Protocol& protocol,
                           const resources::ResourceCatalog& catalog,
                           tools::ToolRegistry& registry,
                           ServerInfo info);

/// MCP `tools/call` result body. Failures are reported in-band with
/// `isError: true`.
[[nodiscard]] auto make_tool_result(const Result<std::string>& outcome) -> json;

} // namespace makemcp::server
