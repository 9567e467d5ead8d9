#pragma once

#include "toolwarden/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolwarden::common {

/// Flat view of a TOML document: `section.key -> raw value text`.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;

  /// Keys under `section.` that no caller asked for; used to warn about typos.
  [[nodiscard]] std::vector<std::string>
  unknown_keys(const std::string &section, const std::vector<std::string> &known) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace toolwarden::common
