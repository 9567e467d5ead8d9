#pragma once

#include "toolwarden/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolwarden::security {

/// One detection rule. `pattern` uses a deliberately small language so that every rule
/// compiles to a linear-time matcher:
///   literal text       matched case-insensitively; a space matches a run of spaces/tabs
///   (a|b|c)            one of several literals
///   \x                 the character x taken literally
///   .*                 any run of characters on the same line
struct PatternRule {
  std::string pattern;
  std::string category;
};

struct PatternMatch {
  bool is_threat = false;
  std::optional<std::string> threat_type;
  std::optional<std::string> pattern_matched;
  /// Original-text span the rule matched (capped at kMaxThreatContentBytes).
  std::optional<std::string> excerpt;
  /// The rule walk ran past the time budget; remaining rules were skipped.
  bool budget_exhausted = false;
  /// Internal failure (allocation); the match is reported as no threat.
  std::optional<std::string> error;
};

class PatternMatcher {
public:
  /// Built-in rule set. Throws std::logic_error only if the built-in table is malformed.
  explicit PatternMatcher(std::chrono::milliseconds time_budget = std::chrono::milliseconds(250));

  [[nodiscard]] static common::Result<PatternMatcher>
  create(const std::vector<PatternRule> &rules,
         std::chrono::milliseconds time_budget = std::chrono::milliseconds(250));

  [[nodiscard]] static const std::vector<PatternRule> &default_rules();

  /// First matching rule wins; structural heuristics run only when no rule matches.
  [[nodiscard]] PatternMatch contains_injection(std::string_view text) const noexcept;

  [[nodiscard]] std::size_t rule_count() const { return rules_.size(); }
  [[nodiscard]] std::chrono::milliseconds time_budget() const { return time_budget_; }

  struct Segment {
    std::vector<std::string> alternatives;
  };
  /// Segments that must appear back to back. Blocks of a rule are separated by `.*`.
  struct Block {
    std::vector<Segment> segments;
    bool first_char[256] = {};
  };
  struct CompiledRule {
    std::string pattern;
    std::string category;
    std::vector<Block> blocks;
  };

private:
  PatternMatcher(std::vector<CompiledRule> rules, std::chrono::milliseconds time_budget);

  [[nodiscard]] PatternMatch scan(std::string_view text) const;

  std::vector<CompiledRule> rules_;
  std::chrono::milliseconds time_budget_;
};

/// Fold full-width Latin letters and angle-bracket homoglyphs to ASCII.
[[nodiscard]] std::string normalize_homoglyphs(std::string_view content);

/// Structural heuristics applied when no rule matched.
[[nodiscard]] bool has_suspicious_structure(std::string_view text);

} // namespace toolwarden::security
