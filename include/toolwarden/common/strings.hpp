#pragma once

#include "toolwarden/common/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace toolwarden::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// Cut `value` to at most `max_bytes` without splitting a UTF-8 sequence.
[[nodiscard]] std::string truncate_utf8(const std::string &value, std::size_t max_bytes);

/// Count non-overlapping occurrences of `needle` in `haystack`.
[[nodiscard]] std::size_t count_occurrences(std::string_view haystack, std::string_view needle);

/// ASCII case-insensitive literal replacement. `max_count == 0` means unlimited.
std::size_t replace_case_insensitive(std::string &target, const std::string &needle,
                                     const std::string &replacement, std::size_t max_count = 0);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);

} // namespace toolwarden::common
