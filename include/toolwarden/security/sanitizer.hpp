#pragma once

#include "toolwarden/common/result.hpp"
#include "toolwarden/security/threat.hpp"

#include <string>

namespace toolwarden::security {

enum class SanitizationMode { Remove, Neutralize, Block };

[[nodiscard]] common::Result<SanitizationMode> sanitization_mode_from_string(const std::string &value);
[[nodiscard]] std::string sanitization_mode_to_string(SanitizationMode mode);

inline constexpr const char *kRemovedPlaceholder = "[REMOVED: Potential security threat detected]";
inline constexpr const char *kBlockedContent =
    "[BLOCKED: Potential security threat detected. Content not displayed.]";

class ResponseSanitizer {
public:
  explicit ResponseSanitizer(SanitizationMode mode = SanitizationMode::Remove) : mode_(mode) {}

  /// Rewrites `content` according to the threats in `scan_result` and sets
  /// `scan_result.sanitized` when the content changed. A safe result returns the input.
  [[nodiscard]] std::string sanitize(const std::string &content, ScanResult &scan_result) const;

  [[nodiscard]] SanitizationMode mode() const { return mode_; }

private:
  SanitizationMode mode_;
};

/// `<!-- Flagged as suspicious: {type} -->`
[[nodiscard]] std::string neutralized_marker(const std::string &threat_type);

} // namespace toolwarden::security
