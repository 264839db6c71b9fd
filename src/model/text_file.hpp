/**
 * @file text_file.hpp
 * @brief Small helpers shared by the line-oriented file parsers.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fleet_usage {

/// Read a whole regular file into memory in one go.
Result<std::string> read_text_file(const std::filesystem::path& path,
                                   ErrorKind kind = ErrorKind::Generic);

/// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string_view> split_lines(std::string_view text);

/// Everything before the first '#'.
std::string_view strip_comment(std::string_view line) noexcept;

/// Trim ASCII whitespace from both ends.
[[nodiscard]] std::string_view trim(std::string_view text) noexcept;

}  // namespace fleet_usage
