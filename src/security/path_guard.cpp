#include "makemcp/security/path_guard.hpp"

#include <algorithm>
#include <iterator>

#include "makemcp/core/logger.hpp"

namespace makemcp::security {

namespace fs = std::filesystem;

namespace {

auto denied() -> Error {
    return make_error(ErrorCode::SecurityViolation, std::string(kPathAccessDenied));
}

} // anonymous namespace

auto is_within(const fs::path& candidate, const fs::path& base) -> bool {
    // Trailing separators produce an empty final element; ignore it so
    // "/a/b/" and "/a/b" compare equal.
    auto base_end = base.end();
    if (base_end != base.begin() && std::prev(base_end)->empty()) --base_end;

    auto [base_it, cand_it] = std::mismatch(base.begin(), base_end,
                                            candidate.begin(), candidate.end());
    return base_it == base_end;
}

auto validate_path(const fs::path& base, const std::optional<fs::path>& subpath)
    -> Result<fs::path> {
    std::error_code ec;
    auto canonical_base = fs::canonical(base, ec);
    if (ec) {
        LOG_DEBUG("Path guard: cannot canonicalize base {}: {}", base.string(), ec.message());
        return std::unexpected(denied());
    }

    if (!subpath) {
        return canonical_base;
    }

    auto full = canonical_base / *subpath;
    auto resolved = fs::weakly_canonical(full, ec);
    if (ec) {
        LOG_DEBUG("Path guard: cannot resolve {}: {}", full.string(), ec.message());
        return std::unexpected(denied());
    }

    if (!is_within(resolved, canonical_base)) {
        LOG_DEBUG("Path guard: {} escapes {}", resolved.string(), canonical_base.string());
        return std::unexpected(denied());
    }

    return resolved;
}

} // namespace makemcp::security
