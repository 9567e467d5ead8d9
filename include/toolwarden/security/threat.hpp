#pragma once

#include "toolwarden/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolwarden::security {

enum class Severity { Low, Medium, High, Critical };

[[nodiscard]] std::string severity_to_string(Severity severity);
[[nodiscard]] inline bool is_high_or_critical(const Severity severity) {
  return severity == Severity::High || severity == Severity::Critical;
}

/// Longest stored threat content / excerpt, in bytes.
inline constexpr std::size_t kMaxThreatContentBytes = 500;

struct Threat {
  std::string type;
  Severity severity = Severity::High;
  std::optional<std::string> location;
  std::optional<std::string> content;
  std::optional<double> confidence;
  std::optional<std::string> pattern_matched;
  /// Literal text the rule matched, when the detector can point at it.
  std::optional<std::string> excerpt;
};

/// A sub-check that could not complete. The scan still returns; the check simply
/// contributed no threats.
struct ScanDiagnostic {
  std::string check;
  std::string message;
};

struct ScanResult {
  std::vector<Threat> threats;
  bool sanitized = false;
  std::chrono::system_clock::time_point scan_timestamp = std::chrono::system_clock::now();
  std::vector<ScanDiagnostic> diagnostics;

  [[nodiscard]] bool safe() const { return threats.empty(); }
  [[nodiscard]] bool has_high_or_critical() const;
  [[nodiscard]] std::vector<std::string> threat_types() const;
};

struct ToolUsageRecord {
  std::string principal_id;
  std::string tool_name;
  std::chrono::system_clock::time_point timestamp;
  std::string params_hash;
  std::size_t response_size = 0;
};

using AlertDetail = std::variant<std::string, std::int64_t, std::vector<std::string>>;

struct SecurityAlert {
  Severity severity = Severity::High;
  std::string message;
  std::map<std::string, AlertDetail> details;
  std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
  std::optional<std::string> principal_id;
  std::optional<std::string> tool_name;
};

[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point timestamp);

[[nodiscard]] std::string threat_to_json(const Threat &threat);
[[nodiscard]] std::string scan_result_to_json(const ScanResult &result);
[[nodiscard]] std::string alert_to_json(const SecurityAlert &alert);

} // namespace toolwarden::security
