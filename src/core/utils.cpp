#include "makemcp/core/utils.hpp"

#include <algorithm>
#include <cctype>

namespace makemcp::utils {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) result += sep;
        result += parts[i];
    }
    return result;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto percent_decode(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            auto hi = hex_value(s[i + 1]);
            auto lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += s[i];
    }
    return result;
}

} // namespace makemcp::utils
