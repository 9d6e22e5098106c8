#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "makemcp/core/error.hpp"
#include "makemcp/core/types.hpp"

namespace makemcp::tools {

using boost::asio::awaitable;

/// Describes a single tool argument.
struct ToolParameter {
    std::string name;
    std::string type;         // JSON Schema type: "string", "integer", ...
    std::string description;
    bool required = true;
    std::optional<json> default_value;
    std::optional<int> minimum;
    std::optional<int> maximum;
};

struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    /// `{name, description, inputSchema}` with a JSON Schema object.
    [[nodiscard]] auto to_json() const -> json;
};

/// A protocol-exposed action. Output is plain text; failures are Errors and
/// are rendered by the protocol layer.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    virtual auto execute(json arguments) -> awaitable<Result<std::string>> = 0;
};

} // namespace makemcp::tools
