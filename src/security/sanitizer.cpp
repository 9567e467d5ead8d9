#include "toolwarden/security/sanitizer.hpp"

#include "toolwarden/common/strings.hpp"

namespace toolwarden::security {

namespace {

bool contains_case_insensitive(const std::string &haystack, const std::string &needle) {
  return common::to_lower(haystack).find(common::to_lower(needle)) != std::string::npos;
}

void remove_threat(std::string &content, const Threat &threat) {
  const std::string placeholder = kRemovedPlaceholder;
  for (const auto *target : {&threat.excerpt, &threat.content, &threat.pattern_matched}) {
    if (!target->has_value() || (*target)->empty()) {
      continue;
    }
    const std::string &needle = **target;
    // Writing a placeholder that contains the needle would leave the threat text behind.
    const std::string &replacement =
        contains_case_insensitive(placeholder, needle) ? std::string() : placeholder;
    common::replace_case_insensitive(content, needle, replacement);
  }
}

void neutralize_threat(std::string &content, const Threat &threat) {
  const std::string marker = neutralized_marker(threat.type);
  for (const auto *target : {&threat.excerpt, &threat.content, &threat.pattern_matched}) {
    if (!target->has_value() || (*target)->empty()) {
      continue;
    }
    if (common::replace_case_insensitive(content, **target, marker, 1) > 0) {
      return;
    }
  }
}

} // namespace

common::Result<SanitizationMode> sanitization_mode_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "remove") {
    return common::Result<SanitizationMode>::success(SanitizationMode::Remove);
  }
  if (normalized == "neutralize") {
    return common::Result<SanitizationMode>::success(SanitizationMode::Neutralize);
  }
  if (normalized == "block") {
    return common::Result<SanitizationMode>::success(SanitizationMode::Block);
  }
  return common::Result<SanitizationMode>::failure("unknown sanitization mode: " + value);
}

std::string sanitization_mode_to_string(const SanitizationMode mode) {
  switch (mode) {
  case SanitizationMode::Remove:
    return "remove";
  case SanitizationMode::Neutralize:
    return "neutralize";
  case SanitizationMode::Block:
    return "block";
  }
  return "remove";
}

std::string neutralized_marker(const std::string &threat_type) {
  return "<!-- Flagged as suspicious: " + threat_type + " -->";
}

std::string ResponseSanitizer::sanitize(const std::string &content, ScanResult &scan_result) const {
  if (scan_result.safe()) {
    return content;
  }

  std::string sanitized = content;
  for (const auto &threat : scan_result.threats) {
    if (is_high_or_critical(threat.severity)) {
      if (mode_ == SanitizationMode::Block) {
        scan_result.sanitized = true;
        return kBlockedContent;
      }
      if (mode_ == SanitizationMode::Remove) {
        remove_threat(sanitized, threat);
      } else {
        neutralize_threat(sanitized, threat);
      }
    } else if (threat.severity == Severity::Medium) {
      neutralize_threat(sanitized, threat);
    }
  }

  if (sanitized != content) {
    scan_result.sanitized = true;
  }
  return sanitized;
}

} // namespace toolwarden::security
