/**
 * @file text_file.cpp
 * @brief File reading and line splitting helpers.
 */

#include "model/text_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fleet_usage {

namespace {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

}  // anonymous namespace

Result<std::string> read_text_file(const std::filesystem::path& path, ErrorKind kind) {
    // A directory opens fine as a stream and then reads as empty.
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) {
        return Error{kind, "could not open " + path.string() + ": " + ec.message()};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return Error{kind, path.string() + " is not a regular file"};
    }

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return Error{kind, "could not open " + path.string() + ": " + std::strerror(errno)};
    }
    std::ostringstream buffer;
    // operator<< sets failbit on the target when nothing was extracted.
    if (ifs.peek() != std::ifstream::traits_type::eof()) {
        buffer << ifs.rdbuf();
        if (buffer.fail() || ifs.bad()) {
            return Error{kind, "could not read " + path.string()};
        }
    } else if (ifs.bad() || (ifs.fail() && !ifs.eof())) {
        return Error{kind, "could not read " + path.string()};
    }
    return buffer.str();
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        auto newline = text.find('\n');
        auto line = text.substr(0, newline);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.push_back(line);
        if (newline == std::string_view::npos) break;
        text.remove_prefix(newline + 1);
    }
    return lines;
}

std::string_view strip_comment(std::string_view line) noexcept {
    return line.substr(0, line.find('#'));
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

}  // namespace fleet_usage
