/**
 * @file filter_policy.cpp
 * @brief Filter policy parsing.
 */

#include "model/filter_policy.hpp"

#include "model/text_file.hpp"

#include <string>

namespace fleet_usage {

namespace {

constexpr std::string_view kArrow = "->";

Error line_error(size_t line_number, std::string_view line, std::string_view what) {
    return Error{ErrorKind::Config,
                 "policy line " + std::to_string(line_number) + ": " + std::string{what}
                     + " (" + std::string{line} + ")"};
}

}  // anonymous namespace

Result<FilterPolicy> parse_filter_policy(std::string_view text) {
    FilterPolicy policy;

    size_t line_number = 0;
    for (auto raw : split_lines(text)) {
        ++line_number;
        auto line = trim(strip_comment(raw));
        if (line.empty()) continue;

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return line_error(line_number, raw, "expected colon after keyword");
        }
        auto keyword = trim(line.substr(0, colon));
        auto rest = trim(line.substr(colon + 1));
        if (rest.empty() || rest.starts_with(kArrow) || rest.ends_with(kArrow)) {
            return line_error(line_number, raw, "expected a value after the keyword");
        }

        if (keyword == "ignore-user") {
            policy.ignored_users.emplace(rest);
        } else if (keyword == "ignore-proc") {
            policy.ignored_processes.emplace(rest);
        } else if (keyword == "rename-proc") {
            auto arrow = rest.find(kArrow);
            if (arrow == std::string_view::npos) {
                return line_error(line_number, raw, "expected rename arrow (->)");
            }
            auto from = trim(rest.substr(0, arrow));
            auto to = trim(rest.substr(arrow + kArrow.size()));
            if (from.empty() || to.empty()) {
                return line_error(line_number, raw, "expected a value on both sides of ->");
            }
            policy.rename_map.insert_or_assign(std::string{from}, std::string{to});
        } else {
            return line_error(line_number, raw, "unknown keyword '" + std::string{keyword} + "'");
        }
    }

    return policy;
}

Result<FilterPolicy> load_filter_policy(const std::filesystem::path& path) {
    auto text = read_text_file(path, ErrorKind::Config);
    if (!text) {
        return text.error().context("could not read filter policy");
    }
    auto policy = parse_filter_policy(*text);
    if (!policy) {
        return policy.error().context("could not parse filter policy " + path.string());
    }
    return policy;
}

Result<FilterPolicy> load_filter_policy_or_empty(const std::filesystem::path& path) {
    auto text = read_text_file(path, ErrorKind::Config);
    if (!text) return FilterPolicy{};

    auto policy = parse_filter_policy(*text);
    if (!policy) {
        return policy.error().context("could not parse filter policy " + path.string());
    }
    return policy;
}

}  // namespace fleet_usage
