#include "makemcp/make/makefile.hpp"

#include <fstream>
#include <sstream>

#include "makemcp/core/logger.hpp"
#include "makemcp/core/utils.hpp"
#include "makemcp/security/path_guard.hpp"

namespace makemcp::make {

namespace fs = std::filesystem;

auto locate_makefile(const fs::path& dir) -> Result<fs::path> {
    auto path = security::validate_path(dir, fs::path(kMakefileName));
    if (!path) return std::unexpected(path.error());

    std::error_code ec;
    if (!fs::is_regular_file(*path, ec)) {
        return std::unexpected(make_error(ErrorCode::MakefileNotFound,
            "No Makefile found in directory", dir.string()));
    }
    return path;
}

auto read_makefile(const fs::path& path) -> Result<std::string> {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::unexpected(make_error(ErrorCode::MakefileNotFound,
            "Makefile not found", path.string()));
    }
    if (!fs::is_regular_file(path, ec)) {
        return std::unexpected(make_error(ErrorCode::MakefileReadFailure,
            "Makefile is not a regular file", path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected(make_error(ErrorCode::MakefileReadFailure,
            "Failed to read Makefile", path.string()));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::MakefileReadFailure,
            "Failed to read Makefile", path.string()));
    }

    LOG_DEBUG("Read Makefile {} ({} bytes)", path.string(), buffer.view().size());
    return buffer.str();
}

auto validate_makefile_syntax(std::string_view content) -> VoidResult {
    if (utils::trim(content).empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidMakefile, "Empty Makefile"));
    }

    auto lines = utils::split(content, '\n');
    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = utils::trim(lines[i]);
        if (line.starts_with('.') && line.find(':') == std::string::npos) {
            return std::unexpected(make_error(ErrorCode::InvalidMakefile,
                "Invalid directive on line " + std::to_string(i + 1)));
        }
    }
    return {};
}

} // namespace makemcp::make
