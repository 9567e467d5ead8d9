#include "toolwarden/security/threat.hpp"

#include "toolwarden/common/json_util.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace toolwarden::security {

namespace {

void append_optional(std::ostringstream &out, const char *key,
                     const std::optional<std::string> &value) {
  out << ",\"" << key << "\":";
  if (value.has_value()) {
    out << common::json_quote(*value);
  } else {
    out << "null";
  }
}

std::string detail_to_json(const AlertDetail &detail) {
  return std::visit(
      [](auto &&value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
          return common::json_quote(value);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(value);
        } else {
          std::string out = "[";
          for (std::size_t i = 0; i < value.size(); ++i) {
            if (i > 0) {
              out += ",";
            }
            out += common::json_quote(value[i]);
          }
          out += "]";
          return out;
        }
      },
      detail);
}

} // namespace

std::string severity_to_string(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "LOW";
  case Severity::Medium:
    return "MEDIUM";
  case Severity::High:
    return "HIGH";
  case Severity::Critical:
    return "CRITICAL";
  }
  return "HIGH";
}

bool ScanResult::has_high_or_critical() const {
  for (const auto &threat : threats) {
    if (is_high_or_critical(threat.severity)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> ScanResult::threat_types() const {
  std::vector<std::string> types;
  types.reserve(threats.size());
  for (const auto &threat : threats) {
    types.push_back(threat.type);
  }
  return types;
}

std::string format_timestamp(const std::chrono::system_clock::time_point timestamp) {
  const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(timestamp);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - seconds).count();
  const std::time_t t = std::chrono::system_clock::to_time_t(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

std::string threat_to_json(const Threat &threat) {
  std::ostringstream out;
  out << "{\"type\":" << common::json_quote(threat.type)
      << ",\"severity\":" << common::json_quote(severity_to_string(threat.severity));
  append_optional(out, "location", threat.location);
  append_optional(out, "content", threat.content);
  out << ",\"confidence\":";
  if (threat.confidence.has_value()) {
    out << *threat.confidence;
  } else {
    out << "null";
  }
  append_optional(out, "pattern_matched", threat.pattern_matched);
  out << "}";
  return out.str();
}

std::string scan_result_to_json(const ScanResult &result) {
  std::ostringstream out;
  out << "{\"safe\":" << (result.safe() ? "true" : "false")
      << ",\"sanitized\":" << (result.sanitized ? "true" : "false") << ",\"threats\":[";
  for (std::size_t i = 0; i < result.threats.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << threat_to_json(result.threats[i]);
  }
  out << "],\"scan_timestamp\":" << common::json_quote(format_timestamp(result.scan_timestamp));
  if (!result.diagnostics.empty()) {
    out << ",\"diagnostics\":[";
    for (std::size_t i = 0; i < result.diagnostics.size(); ++i) {
      if (i > 0) {
        out << ",";
      }
      out << "{\"check\":" << common::json_quote(result.diagnostics[i].check)
          << ",\"message\":" << common::json_quote(result.diagnostics[i].message) << "}";
    }
    out << "]";
  }
  out << "}";
  return out.str();
}

std::string alert_to_json(const SecurityAlert &alert) {
  std::ostringstream out;
  out << "{\"severity\":" << common::json_quote(severity_to_string(alert.severity))
      << ",\"message\":" << common::json_quote(alert.message) << ",\"details\":{";
  bool first = true;
  for (const auto &[key, value] : alert.details) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << common::json_quote(key) << ":" << detail_to_json(value);
  }
  out << "},\"timestamp\":" << common::json_quote(format_timestamp(alert.timestamp));
  append_optional(out, "principal_id", alert.principal_id);
  append_optional(out, "tool_name", alert.tool_name);
  out << "}";
  return out.str();
}

} // namespace toolwarden::security
