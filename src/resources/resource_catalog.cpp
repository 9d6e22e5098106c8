#include "makemcp/resources/resource_catalog.hpp"

#include "makemcp/core/logger.hpp"
#include "makemcp/core/utils.hpp"
#include "makemcp/make/makefile.hpp"

namespace makemcp::resources {

namespace {

/// Collapses repeated slashes and strips leading/trailing ones.
auto normalize_resource_path(std::string_view path) -> std::string {
    std::vector<std::string> segments;
    for (auto& segment : utils::split(path, '/')) {
        if (!segment.empty()) segments.push_back(std::move(segment));
    }
    return utils::join(segments, "/");
}

auto read_failure(const Error& cause) -> Error {
    return make_error(ErrorCode::ResourceReadFailure,
        "Failed to read resource", cause.what());
}

} // anonymous namespace

void to_json(json& j, const ResourceDescriptor& d) {
    j = json{
        {"uri", d.uri},
        {"name", d.name},
        {"description", d.description},
        {"mimeType", d.mime_type},
    };
}

void to_json(json& j, const ResourceContent& c) {
    j = json{
        {"uri", c.uri},
        {"mimeType", c.mime_type},
        {"text", c.text},
    };
}

auto parse_resource_uri(std::string_view uri) -> Result<ResourceKind> {
    auto sep = uri.find("://");
    if (sep == std::string_view::npos ||
        utils::to_lower(uri.substr(0, sep)) != kUriScheme) {
        return std::unexpected(make_error(ErrorCode::UnknownResource,
            "Unsupported URI scheme", std::string(uri)));
    }

    auto path = utils::to_lower(normalize_resource_path(
        utils::percent_decode(uri.substr(sep + 3))));
    if (path.starts_with("localhost/")) {
        path.erase(0, std::string_view("localhost/").size());
    }

    if (path == "current/makefile") return ResourceKind::Makefile;
    if (path == "targets") return ResourceKind::Targets;

    return std::unexpected(make_error(ErrorCode::UnknownResource,
        "Unknown resource path", path));
}

auto resource_uri(ResourceKind kind) -> std::string_view {
    switch (kind) {
        case ResourceKind::Makefile: return kMakefileUri;
        case ResourceKind::Targets: return kTargetsUri;
    }
    return kMakefileUri;
}

// ---------------------------------------------------------------------------
// ResourceCatalog
// ---------------------------------------------------------------------------

ResourceCatalog::ResourceCatalog(std::filesystem::path makefile_dir)
    : makefile_dir_(std::move(makefile_dir)) {}

auto ResourceCatalog::load_makefile() const -> Result<std::string> {
    auto path = make::locate_makefile(makefile_dir_);
    if (!path) return std::unexpected(path.error());
    return make::read_makefile(*path);
}

auto ResourceCatalog::list_targets() const -> Result<std::vector<make::Target>> {
    auto content = load_makefile();
    if (!content) return std::unexpected(content.error());
    return make::parse_targets(*content);
}

auto ResourceCatalog::list_resources() const -> std::vector<ResourceDescriptor> {
    std::vector<ResourceDescriptor> resources;

    auto content = load_makefile();
    if (!content) {
        LOG_WARN("Listing resources: {}", content.error().what());
        return resources;
    }

    resources.push_back(ResourceDescriptor{
        .uri = std::string(kMakefileUri),
        .name = "Current Makefile",
        .description = "Contents of the Makefile in the working directory",
        .mime_type = "text/plain",
    });

    if (!make::parse_targets(*content).empty()) {
        resources.push_back(ResourceDescriptor{
            .uri = std::string(kTargetsUri),
            .name = "Make Targets",
            .description = "Targets defined in the Makefile with their descriptions",
            .mime_type = "application/json",
        });
    }

    return resources;
}

auto ResourceCatalog::read_resource(std::string_view uri) const -> Result<ResourceContent> {
    auto kind = parse_resource_uri(uri);
    if (!kind) return std::unexpected(kind.error());

    auto content = load_makefile();
    if (!content) return std::unexpected(read_failure(content.error()));

    switch (*kind) {
        case ResourceKind::Makefile: {
            if (auto valid = make::validate_makefile_syntax(*content); !valid) {
                return std::unexpected(read_failure(valid.error()));
            }
            return ResourceContent{std::string(uri), "text/plain", std::move(*content)};
        }
        case ResourceKind::Targets: {
            json targets = make::parse_targets(*content);
            return ResourceContent{std::string(uri), "application/json", targets.dump(2)};
        }
    }

    return std::unexpected(make_error(ErrorCode::UnknownResource,
        "Unknown resource", std::string(uri)));
}

} // namespace makemcp::resources
