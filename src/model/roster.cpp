/**
 * @file roster.cpp
 * @brief Roster file parsing.
 */

#include "model/roster.hpp"

#include "model/owner.hpp"
#include "model/text_file.hpp"

#include <algorithm>
#include <string>

namespace fleet_usage {

namespace {

Error line_error(size_t line_number, std::string_view line, std::string_view what) {
    return Error{ErrorKind::Config,
                 "roster line " + std::to_string(line_number) + ": " + std::string{what}
                     + " (" + std::string{line} + ")"};
}

bool contains_space(std::string_view text) {
    return std::any_of(text.begin(), text.end(),
                       [](char c) { return c == ' ' || c == '\t'; });
}

}  // anonymous namespace

Result<Roster> parse_roster(std::string_view text) {
    Roster roster;
    std::string room{kOrphanRoom};

    size_t line_number = 0;
    for (auto raw : split_lines(text)) {
        ++line_number;
        auto line = trim(strip_comment(raw));
        if (line.empty()) continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return line_error(line_number, raw, "unterminated room header");
            }
            auto header = trim(line.substr(1, line.size() - 2));
            if (header.empty()) {
                return line_error(line_number, raw, "empty room name");
            }
            room = std::string{header};
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos) {
            return line_error(line_number, raw, "expected 'hostname: note'");
        }
        auto hostname = trim(line.substr(0, colon));
        if (hostname.empty()) {
            return line_error(line_number, raw, "missing hostname");
        }
        if (contains_space(hostname)) {
            return line_error(line_number, raw, "hostname contains whitespace");
        }

        roster.push_back(MachineIdentity{
            .hostname = std::string{hostname},
            .room = room,
            .owner = parse_owner(line.substr(colon + 1)),
        });
    }

    return roster;
}

Result<Roster> load_roster(const std::filesystem::path& path) {
    auto text = read_text_file(path, ErrorKind::Config);
    if (!text) {
        return text.error().context("could not read roster");
    }
    auto roster = parse_roster(*text);
    if (!roster) {
        return roster.error().context("could not parse roster " + path.string());
    }
    return roster;
}

}  // namespace fleet_usage
