#include "makemcp/make/target_parser.hpp"

#include "makemcp/core/logger.hpp"
#include "makemcp/core/utils.hpp"

namespace makemcp::make {

namespace {

auto is_name_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

auto is_name_char(char c) -> bool {
    return is_name_start(c) || c == '_' || c == '-';
}

/// `:=`, `::=` and `:::=` assign variables; the line names no target.
auto is_assignment(std::string_view line, size_t colon) -> bool {
    auto pos = line.find_first_not_of(':', colon);
    return pos != std::string_view::npos && line[pos] == '=';
}

auto strip_trailing_cr(std::string_view line) -> std::string_view {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

} // anonymous namespace

auto is_valid_target_name(std::string_view name) -> bool {
    if (name.empty() || !is_name_start(name.front())) return false;
    for (char c : name) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

auto parse_targets(std::string_view content) -> std::vector<Target> {
    std::vector<Target> targets;
    std::vector<std::string> pending_comment;

    size_t pos = 0;
    while (pos < content.size()) {
        auto eol = content.find('\n', pos);
        auto raw = strip_trailing_cr(content.substr(
            pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos));
        pos = eol == std::string_view::npos ? content.size() : eol + 1;

        auto line = utils::trim(raw);

        if (line.starts_with('#')) {
            pending_comment.push_back(utils::trim(std::string_view(line).substr(1)));
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos || raw.starts_with('\t')) {
            pending_comment.clear();
            continue;
        }

        if (is_assignment(line, colon)) {
            pending_comment.clear();
            continue;
        }

        auto name = utils::trim(std::string_view(line).substr(0, colon));

        std::optional<std::string> description;
        auto inline_marker = line.find("##");
        if (inline_marker != std::string::npos) {
            auto text = utils::trim(std::string_view(line).substr(inline_marker + 2));
            if (!text.empty()) description = std::move(text);
        }
        if (!description) {
            auto joined = utils::trim(utils::join(pending_comment, " "));
            if (!joined.empty()) description = std::move(joined);
        }
        pending_comment.clear();

        if (!is_valid_target_name(name)) {
            LOG_TRACE("Skipping non-target line: '{}'", line);
            continue;
        }

        targets.push_back(Target{std::move(name), std::move(description)});
    }

    return targets;
}

} // namespace makemcp::make
