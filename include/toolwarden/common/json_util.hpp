#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolwarden::common {

/// Escape a string for embedding inside a JSON string literal.
/// Control characters are written as \u00XX so the output is always valid JSON.
[[nodiscard]] std::string json_escape(const std::string &value);

/// json_escape wrapped in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Parse a flat JSON object into a key->raw value map (top level only).
/// String values are unescaped; objects, arrays and scalars keep their JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Same as json_parse_flat but keeps document order of keys.
using JsonOrderedEntries = std::vector<std::pair<std::string, std::string>>;
[[nodiscard]] JsonOrderedEntries json_parse_entries(const std::string &json);

/// Split a JSON array into its top-level element texts. String elements are unescaped.
[[nodiscard]] std::vector<std::string> json_split_array(const std::string &array_json);

/// True when `raw` looks like a JSON literal that must not be quoted (number, bool, null,
/// object, array).
[[nodiscard]] bool json_is_raw_literal(const std::string &raw);

/// Render a string map as a JSON object with keys in sorted order. Values that already
/// look like JSON literals are emitted raw; everything else is quoted.
[[nodiscard]] std::string json_render_object(const std::map<std::string, std::string> &values);

} // namespace toolwarden::common
