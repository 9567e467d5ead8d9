#include "toolwarden/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace toolwarden::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4U;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  out = value;
  return true;
}

bool is_json_number(const std::string &raw) {
  std::size_t pos = 0;
  if (pos < raw.size() && raw[pos] == '-') {
    ++pos;
  }
  if (pos >= raw.size() || std::isdigit(static_cast<unsigned char>(raw[pos])) == 0) {
    return false;
  }
  if (raw[pos] == '0' && pos + 1 < raw.size() &&
      std::isdigit(static_cast<unsigned char>(raw[pos + 1])) != 0) {
    return false;
  }
  bool seen_dot = false;
  bool seen_exp = false;
  for (; pos < raw.size(); ++pos) {
    const char ch = raw[pos];
    if (std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    if (ch == '.' && !seen_dot && !seen_exp) {
      seen_dot = true;
      continue;
    }
    if ((ch == 'e' || ch == 'E') && !seen_exp) {
      seen_exp = true;
      if (pos + 1 < raw.size() && (raw[pos + 1] == '+' || raw[pos + 1] == '-')) {
        ++pos;
      }
      continue;
    }
    return false;
  }
  const char last = raw.back();
  return std::isdigit(static_cast<unsigned char>(last)) != 0;
}

// Reads one value starting at pos. Returns the position after it, or npos.
std::size_t read_value(const std::string &json, std::size_t pos, std::string &out) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  if (json[pos] == '"') {
    const auto end = json_find_string_end(json, pos);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    out = json_unescape(json.substr(pos + 1, end - pos - 1));
    return end + 1;
  }
  if (json[pos] == '{' || json[pos] == '[') {
    const char open = json[pos];
    const char close = (open == '{') ? '}' : ']';
    const auto end = json_find_matching_token(json, pos, open, close);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    out = json.substr(pos, end - pos + 1);
    return end + 1;
  }
  const std::size_t start = pos;
  while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
         std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
    ++pos;
  }
  out = json.substr(start, pos - start);
  return pos;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (cp >= 0xD800U && cp <= 0xDBFFU && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00U && low <= 0xDFFFU) {
          cp = 0x10000U + ((cp - 0xD800U) << 10U) + (low - 0xDC00U);
          i += 6;
        }
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

JsonOrderedEntries json_parse_entries(const std::string &json) {
  JsonOrderedEntries result;
  const std::size_t begin = json_skip_ws(json, 0);
  if (begin >= json.size() || json[begin] != '{') {
    return result;
  }

  std::size_t pos = begin + 1;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      break;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(json, pos + 1);

    std::string value;
    pos = read_value(json, pos, value);
    if (pos == std::string::npos) {
      break;
    }
    result.emplace_back(std::move(key), std::move(value));
  }
  return result;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  for (auto &[key, value] : json_parse_entries(json)) {
    result[key] = std::move(value);
  }
  return result;
}

std::vector<std::string> json_split_array(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t begin = json_skip_ws(array_json, 0);
  if (begin >= array_json.size() || array_json[begin] != '[') {
    return out;
  }

  std::size_t pos = begin + 1;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    std::string value;
    const auto next = read_value(array_json, pos, value);
    if (next == std::string::npos || next == pos) {
      break;
    }
    out.push_back(std::move(value));
    pos = next;
  }
  return out;
}

bool json_is_raw_literal(const std::string &raw) {
  if (raw.empty()) {
    return false;
  }
  if (raw == "true" || raw == "false" || raw == "null") {
    return true;
  }
  if (raw.front() == '{') {
    return json_find_matching_token(raw, 0, '{', '}') == raw.size() - 1;
  }
  if (raw.front() == '[') {
    return json_find_matching_token(raw, 0, '[', ']') == raw.size() - 1;
  }
  return is_json_number(raw);
}

std::string json_render_object(const std::map<std::string, std::string> &values) {
  std::string out = "{";
  bool first = true;
  for (const auto &[key, value] : values) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += json_quote(key);
    out += ":";
    out += json_is_raw_literal(value) ? value : json_quote(value);
  }
  out += "}";
  return out;
}

} // namespace toolwarden::common
