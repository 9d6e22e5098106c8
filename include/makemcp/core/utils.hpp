#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace makemcp::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;

/// RFC 3986 percent-decoding. Malformed escapes are kept literally and
/// '+' is not treated as a space.
auto percent_decode(std::string_view s) -> std::string;

} // namespace makemcp::utils
