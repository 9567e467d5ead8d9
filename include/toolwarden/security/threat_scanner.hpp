#pragma once

#include "toolwarden/common/result.hpp"
#include "toolwarden/security/pattern_matcher.hpp"
#include "toolwarden/security/threat.hpp"
#include "toolwarden/tools/tool.hpp"

#include <memory>
#include <optional>
#include <string>

namespace toolwarden::security {

struct MlVerdict {
  bool is_threat = false;
  double confidence = 0.0;
};

/// Optional second-opinion classifier for tool responses. Implementations must be
/// safe to call from several threads at once.
class IMlClassifier {
public:
  virtual ~IMlClassifier() = default;
  [[nodiscard]] virtual bool enabled() const = 0;
  [[nodiscard]] virtual common::Result<MlVerdict> classify(const std::string &text) = 0;
};

class ThreatScanner {
public:
  explicit ThreatScanner(std::shared_ptr<const PatternMatcher> matcher,
                         std::shared_ptr<IMlClassifier> classifier = nullptr);

  [[nodiscard]] ScanResult scan_text(const std::string &text,
                                     const std::optional<std::string> &context = std::nullopt) const;

  /// Tool description is HIGH; parameter descriptions and examples are MEDIUM.
  [[nodiscard]] ScanResult scan_tool_schema(const tools::ToolSchema &schema) const;

  [[nodiscard]] ScanResult scan_tool_response(const std::string &response) const;

  [[nodiscard]] const PatternMatcher &matcher() const { return *matcher_; }

private:
  std::optional<PatternMatch> match(const std::string &text, const std::string &check,
                                    ScanResult &result) const;
  void run_classifier(const std::string &text, ScanResult &result) const;

  std::shared_ptr<const PatternMatcher> matcher_;
  std::shared_ptr<IMlClassifier> classifier_;
};

} // namespace toolwarden::security
