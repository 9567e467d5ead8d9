#include "toolwarden/common/strings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

namespace toolwarden::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string truncate_utf8(const std::string &value, const std::size_t max_bytes) {
  if (value.size() <= max_bytes) {
    return value;
  }
  std::size_t cut = max_bytes;
  // Back off continuation bytes so the cut lands on a sequence boundary.
  while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return value.substr(0, cut);
}

std::size_t count_occurrences(const std::string_view haystack, const std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  std::size_t count = 0;
  std::size_t pos = haystack.find(needle);
  while (pos != std::string_view::npos) {
    ++count;
    pos = haystack.find(needle, pos + needle.size());
  }
  return count;
}

std::size_t replace_case_insensitive(std::string &target, const std::string &needle,
                                     const std::string &replacement,
                                     const std::size_t max_count) {
  if (needle.empty() || target.size() < needle.size()) {
    return 0;
  }

  const std::string lower_target = to_lower(target);
  const std::string lower_needle = to_lower(needle);

  std::string output;
  std::size_t replaced = 0;
  std::size_t cursor = 0;
  while (max_count == 0 || replaced < max_count) {
    const auto pos = lower_target.find(lower_needle, cursor);
    if (pos == std::string::npos) {
      break;
    }
    if (replaced == 0) {
      output.reserve(target.size());
    }
    output.append(target, cursor, pos - cursor);
    output += replacement;
    cursor = pos + needle.size();
    ++replaced;
  }

  if (replaced == 0) {
    return 0;
  }
  output.append(target, cursor, std::string::npos);
  target = std::move(output);
  return replaced;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

} // namespace toolwarden::common
