#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "makemcp/core/config.hpp"
#include "makemcp/core/error.hpp"
#include "makemcp/make/target_parser.hpp"

namespace makemcp::resources {

inline constexpr std::string_view kUriScheme = "make";
inline constexpr std::string_view kMakefileUri = "make://current/makefile";
inline constexpr std::string_view kTargetsUri = "make://targets";

enum class ResourceKind {
    Makefile,
    Targets,
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

void to_json(json& j, const ResourceDescriptor& d);

struct ResourceContent {
    std::string uri;
    std::string mime_type;
    std::string text;
};

void to_json(json& j, const ResourceContent& c);

/// Maps a `make://` URI onto a resource kind. The path is percent-decoded,
/// slash-collapsed and compared case-insensitively; an optional `localhost`
/// authority is accepted. Fails with UnknownResource.
auto parse_resource_uri(std::string_view uri) -> Result<ResourceKind>;

[[nodiscard]] auto resource_uri(ResourceKind kind) -> std::string_view;

/// Read-only view of one Makefile directory as protocol resources.
class ResourceCatalog {
public:
    explicit ResourceCatalog(std::filesystem::path makefile_dir);

    /// Makefile descriptor when the file exists; targets descriptor only
    /// when at least one target parses.
    [[nodiscard]] auto list_resources() const -> std::vector<ResourceDescriptor>;

    /// Fails with UnknownResource for foreign URIs and ResourceReadFailure
    /// when the underlying Makefile cannot be resolved, read or accepted.
    [[nodiscard]] auto read_resource(std::string_view uri) const -> Result<ResourceContent>;

    /// Current targets of the Makefile.
    [[nodiscard]] auto list_targets() const -> Result<std::vector<make::Target>>;

    [[nodiscard]] auto makefile_dir() const -> const std::filesystem::path& { return makefile_dir_; }

private:
    auto load_makefile() const -> Result<std::string>;

    std::filesystem::path makefile_dir_;
};

} // namespace makemcp::resources
