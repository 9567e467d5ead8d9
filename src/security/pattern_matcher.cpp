#include "toolwarden/security/pattern_matcher.hpp"

#include "toolwarden/common/strings.hpp"
#include "toolwarden/security/threat.hpp"

#include <cctype>
#include <cstdint>
#include <exception>
#include <stdexcept>

namespace toolwarden::security {

namespace {

constexpr std::size_t NPOS = std::string::npos;

const std::vector<std::string> kHiddenSpanMarkers = {
    "<span style=\"color:white\">",
    "<span style=\"font-size:0px\">",
    "<span style=\"opacity:0\">",
};

bool decode_utf8_codepoint(const std::string_view input, std::size_t &index, std::uint32_t &cp) {
  if (index >= input.size()) {
    return false;
  }

  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    cp = lead;
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    cp = lead;
    ++index;
    return true;
  }

  if (index + extra >= input.size()) {
    cp = lead;
    ++index;
    return true;
  }

  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char next = static_cast<unsigned char>(input[index + i]);
    if ((next & 0xC0U) != 0x80U) {
      cp = lead;
      ++index;
      return true;
    }
    value = (value << 6U) | (next & 0x3FU);
  }

  cp = value;
  index += extra + 1;
  return true;
}

/// Returns 0 when the code point has no ASCII fold.
char fold_codepoint(const std::uint32_t cp) {
  if (cp >= 0xFF21U && cp <= 0xFF3AU) {
    return static_cast<char>(cp - 0xFEE0U);
  }
  if (cp >= 0xFF41U && cp <= 0xFF5AU) {
    return static_cast<char>(cp - 0xFEE0U);
  }

  switch (cp) {
  case 0xFF1CU:
  case 0x2329U:
  case 0x3008U:
  case 0x2039U:
  case 0x27E8U:
  case 0xFE64U:
    return '<';
  case 0xFF1EU:
  case 0x232AU:
  case 0x3009U:
  case 0x203AU:
  case 0x27E9U:
  case 0xFE65U:
    return '>';
  default:
    break;
  }
  return 0;
}

/// Uppercase letters in ASCII, Latin-1, Latin Extended-A, Greek and basic Cyrillic.
bool is_uppercase_codepoint(const std::uint32_t cp) {
  if (cp < 0x80U) {
    return std::isupper(static_cast<unsigned char>(cp)) != 0;
  }
  if (cp >= 0xC0U && cp <= 0xDEU) {
    return cp != 0xD7U;
  }
  if ((cp >= 0x100U && cp <= 0x137U) || (cp >= 0x14AU && cp <= 0x177U)) {
    return cp % 2 == 0;
  }
  if ((cp >= 0x139U && cp <= 0x148U) || (cp >= 0x179U && cp <= 0x17EU)) {
    return cp % 2 == 1;
  }
  if (cp == 0x178U) {
    return true;
  }
  if (cp >= 0x391U && cp <= 0x3A9U) {
    return cp != 0x3A2U;
  }
  return cp >= 0x400U && cp <= 0x42FU;
}

/// Folds homoglyphs and lower-cases ASCII. When folding shrinks the text, `offsets`
/// receives the original byte offset of every normalized byte (plus one past the end).
std::string normalize_for_matching(const std::string_view content,
                                   std::vector<std::size_t> &offsets) {
  std::string output;
  output.reserve(content.size());
  offsets.clear();

  bool folded_any = false;
  std::size_t index = 0;
  while (index < content.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    if (!decode_utf8_codepoint(content, index, cp)) {
      break;
    }
    const char folded = cp >= 0x80U ? fold_codepoint(cp) : 0;
    if (folded != 0) {
      if (!folded_any) {
        folded_any = true;
        offsets.reserve(content.size() + 1);
        for (std::size_t i = 0; i < output.size(); ++i) {
          offsets.push_back(i);
        }
      }
      offsets.push_back(start);
      output.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(folded))));
      continue;
    }
    for (std::size_t i = start; i < index; ++i) {
      if (folded_any) {
        offsets.push_back(i);
      }
      output.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(content[i]))));
    }
  }
  if (folded_any) {
    offsets.push_back(content.size());
  }
  return output;
}

bool is_blank(const char ch) { return ch == ' ' || ch == '\t'; }

std::size_t match_literal(const std::string_view text, std::size_t pos, const std::size_t limit,
                          const std::string &literal) {
  for (const char expected : literal) {
    if (pos >= limit) {
      return NPOS;
    }
    if (expected == ' ') {
      if (!is_blank(text[pos])) {
        return NPOS;
      }
      while (pos < limit && is_blank(text[pos])) {
        ++pos;
      }
      continue;
    }
    if (text[pos] != expected) {
      return NPOS;
    }
    ++pos;
  }
  return pos;
}

/// Smallest end position at which segments[index..] match starting exactly at `pos`.
std::size_t match_segments(const std::string_view text, const std::size_t pos,
                           const std::size_t limit,
                           const std::vector<PatternMatcher::Segment> &segments,
                           const std::size_t index) {
  if (index == segments.size()) {
    return pos;
  }
  std::size_t best = NPOS;
  for (const auto &alternative : segments[index].alternatives) {
    const std::size_t next = match_literal(text, pos, limit, alternative);
    if (next == NPOS) {
      continue;
    }
    const std::size_t end = match_segments(text, next, limit, segments, index + 1);
    if (end != NPOS && end < best) {
      best = end;
    }
  }
  return best;
}

struct Span {
  std::size_t begin = NPOS;
  std::size_t end = NPOS;
};

/// Earliest-ending occurrence of `block` inside [from, limit).
Span find_block(const std::string_view text, const std::size_t from, const std::size_t limit,
                const PatternMatcher::Block &block) {
  Span span;
  for (std::size_t start = from; start < limit; ++start) {
    if (span.end != NPOS && start + 1 >= span.end) {
      break;
    }
    if (!block.first_char[static_cast<unsigned char>(text[start])]) {
      continue;
    }
    // A leading space consumes the whole blank run, so only the run's first byte can start
    // a distinct match.
    if (start > from && is_blank(text[start]) && is_blank(text[start - 1])) {
      continue;
    }
    const std::size_t end = match_segments(text, start, limit, block.segments, 0);
    if (end != NPOS && (span.end == NPOS || end < span.end)) {
      span.begin = start;
      span.end = end;
    }
  }
  return span;
}

/// Blocks are chained greedily by earliest end; a gap never crosses a line break.
Span find_rule(const std::string_view text, const PatternMatcher::CompiledRule &rule) {
  std::size_t line_start = 0;
  while (line_start <= text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = text.size();
    }

    Span matched;
    std::size_t cursor = line_start;
    bool complete = true;
    for (std::size_t i = 0; i < rule.blocks.size(); ++i) {
      const Span span = find_block(text, cursor, line_end, rule.blocks[i]);
      if (span.end == NPOS) {
        complete = false;
        break;
      }
      if (i == 0) {
        matched.begin = span.begin;
      }
      matched.end = span.end;
      cursor = span.end;
      // A trailing space only needs one blank, so the next block may start inside the run.
      while (cursor - span.begin >= 2 && is_blank(text[cursor - 1]) && is_blank(text[cursor - 2])) {
        --cursor;
      }
    }
    if (complete) {
      return matched;
    }
    if (line_end == text.size()) {
      break;
    }
    line_start = line_end + 1;
  }
  return {};
}

void finish_block(std::vector<PatternMatcher::Block> &blocks, PatternMatcher::Block &block) {
  if (block.segments.empty()) {
    return;
  }
  for (const auto &alternative : block.segments.front().alternatives) {
    const unsigned char first = static_cast<unsigned char>(alternative.front());
    block.first_char[first] = true;
    if (first == ' ') {
      block.first_char[static_cast<unsigned char>('\t')] = true;
    }
  }
  blocks.push_back(block);
  block = PatternMatcher::Block{};
}

void append_literal(PatternMatcher::Block &block, bool &open_literal, const char ch) {
  if (!open_literal) {
    block.segments.push_back(PatternMatcher::Segment{{std::string()}});
    open_literal = true;
  }
  block.segments.back().alternatives.front().push_back(ch);
}

common::Result<PatternMatcher::CompiledRule> compile_rule(const PatternRule &rule) {
  using R = common::Result<PatternMatcher::CompiledRule>;
  PatternMatcher::CompiledRule compiled{.pattern = rule.pattern, .category = rule.category, .blocks = {}};

  const std::string source = common::to_lower(rule.pattern);
  PatternMatcher::Block block;
  bool open_literal = false;

  for (std::size_t i = 0; i < source.size(); ++i) {
    const char ch = source[i];
    if (ch == '\\') {
      if (i + 1 >= source.size()) {
        return R::failure("dangling escape in pattern: " + rule.pattern);
      }
      append_literal(block, open_literal, source[++i]);
      continue;
    }
    if (ch == '.' && i + 1 < source.size() && source[i + 1] == '*') {
      ++i;
      open_literal = false;
      finish_block(compiled.blocks, block);
      continue;
    }
    if (ch == '(') {
      PatternMatcher::Segment segment;
      std::string current;
      bool closed = false;
      for (++i; i < source.size(); ++i) {
        const char inner = source[i];
        if (inner == '\\' && i + 1 < source.size()) {
          current.push_back(source[++i]);
        } else if (inner == '|') {
          segment.alternatives.push_back(current);
          current.clear();
        } else if (inner == ')') {
          segment.alternatives.push_back(current);
          closed = true;
          break;
        } else if (inner == '(' || inner == '*' || inner == '.' || inner == '[') {
          return R::failure("unsupported construct inside group in pattern: " + rule.pattern);
        } else {
          current.push_back(inner);
        }
      }
      if (!closed) {
        return R::failure("unterminated group in pattern: " + rule.pattern);
      }
      for (const auto &alternative : segment.alternatives) {
        if (alternative.empty()) {
          return R::failure("empty alternative in pattern: " + rule.pattern);
        }
      }
      block.segments.push_back(std::move(segment));
      open_literal = false;
      continue;
    }
    if (ch == ')' || ch == '|' || ch == '*' || ch == '.' || ch == '[' || ch == ']' ||
        ch == '?' || ch == '+' || ch == '^' || ch == '$') {
      return R::failure("unsupported character '" + std::string(1, ch) +
                        "' in pattern: " + rule.pattern);
    }
    append_literal(block, open_literal, ch);
  }
  finish_block(compiled.blocks, block);

  if (compiled.blocks.empty()) {
    return R::failure("pattern matches everything: " + rule.pattern);
  }
  return R::success(std::move(compiled));
}

} // namespace

const std::vector<PatternRule> &PatternMatcher::default_rules() {
  static const std::vector<PatternRule> rules = {
      {R"(ignore (previous|above|prior) (instructions|prompts|context))", "INSTRUCTION_OVERRIDE"},
      {R"(disregard (previous|above) (instructions|prompts))", "INSTRUCTION_OVERRIDE"},
      {R"(forget (everything|all) (before|above))", "INSTRUCTION_OVERRIDE"},
      {R"(ignore (all|everything) (above|before|prior))", "INSTRUCTION_OVERRIDE"},

      {R"(you are now (a|an) .* instead)", "ROLE_MANIPULATION"},
      {R"(act as (a|an) .*)", "ROLE_MANIPULATION"},
      {R"(pretend to be .*)", "ROLE_MANIPULATION"},
      {R"(you are (a|an) .* now)", "ROLE_MANIPULATION"},

      {R"(reveal your (system prompt|instructions))", "PROMPT_LEAKAGE"},
      {R"(what (are|were) your (original|initial) instructions)", "PROMPT_LEAKAGE"},
      {R"(show me your (system|initial) prompt)", "PROMPT_LEAKAGE"},
      {R"(print your (system|initial) instructions)", "PROMPT_LEAKAGE"},

      {R"(send .* to (http|https)://)", "DATA_EXFILTRATION"},
      {R"(post .* to .*)", "DATA_EXFILTRATION"},
      {R"(upload .* to .*)", "DATA_EXFILTRATION"},
      {R"(read .*\.(ssh|env|key|pem))", "DATA_EXFILTRATION"},
      {R"(read .*\.(config|secret|password))", "DATA_EXFILTRATION"},

      {R"(execute (command|script|code))", "COMMAND_INJECTION"},
      {R"(run (bash|sh|python|node) .*)", "COMMAND_INJECTION"},
      {R"(eval\()", "COMMAND_INJECTION"},
      {R"(exec\()", "COMMAND_INJECTION"},
      {R"(subprocess\.)", "COMMAND_INJECTION"},

      {R"(add to context:)", "CONTEXT_MANIPULATION"},
      {R"(remember (this|that):)", "CONTEXT_MANIPULATION"},
      {R"(important note:)", "CONTEXT_MANIPULATION"},
      {R"(store (this|that) in memory)", "CONTEXT_MANIPULATION"},

      // U+200B, U+200C, U+200D, U+FEFF
      {"(\xE2\x80\x8B|\xE2\x80\x8C|\xE2\x80\x8D|\xEF\xBB\xBF)", "HIDDEN_CHARACTERS"},

      {R"(\.(ru|cn|tk)/exfil)", "SUSPICIOUS_URL"},
      {R"((http|https)://.*\.(ru|cn|tk)/)", "SUSPICIOUS_URL"},
  };
  return rules;
}

PatternMatcher::PatternMatcher(const std::chrono::milliseconds time_budget)
    : time_budget_(time_budget) {
  auto created = create(default_rules(), time_budget);
  if (!created.ok()) {
    throw std::logic_error("built-in pattern rules failed to compile: " + created.error());
  }
  rules_ = std::move(created.value().rules_);
}

PatternMatcher::PatternMatcher(std::vector<CompiledRule> rules,
                               const std::chrono::milliseconds time_budget)
    : rules_(std::move(rules)), time_budget_(time_budget) {}

common::Result<PatternMatcher> PatternMatcher::create(const std::vector<PatternRule> &rules,
                                                      const std::chrono::milliseconds time_budget) {
  if (time_budget.count() <= 0) {
    return common::Result<PatternMatcher>::failure("pattern time budget must be positive");
  }
  std::vector<CompiledRule> compiled;
  compiled.reserve(rules.size());
  for (const auto &rule : rules) {
    if (rule.category.empty()) {
      return common::Result<PatternMatcher>::failure("pattern has no category: " + rule.pattern);
    }
    auto result = compile_rule(rule);
    if (!result.ok()) {
      return common::Result<PatternMatcher>::failure(result.error());
    }
    compiled.push_back(std::move(result.value()));
  }
  return common::Result<PatternMatcher>::success(PatternMatcher(std::move(compiled), time_budget));
}

PatternMatch PatternMatcher::contains_injection(const std::string_view text) const noexcept {
  if (text.empty()) {
    return {};
  }
  try {
    return scan(text);
  } catch (const std::exception &e) {
    PatternMatch failed;
    failed.error = e.what();
    return failed;
  }
}

PatternMatch PatternMatcher::scan(const std::string_view text) const {
  const auto started = std::chrono::steady_clock::now();

  std::vector<std::size_t> offsets;
  const std::string normalized = normalize_for_matching(text, offsets);

  for (const auto &rule : rules_) {
    if (std::chrono::steady_clock::now() - started > time_budget_) {
      PatternMatch exhausted;
      exhausted.budget_exhausted = true;
      return exhausted;
    }

    const Span span = find_rule(normalized, rule);
    if (span.end == NPOS) {
      continue;
    }

    std::size_t begin = span.begin;
    std::size_t end = span.end;
    if (!offsets.empty()) {
      begin = offsets[begin];
      end = offsets[end];
    }
    PatternMatch match;
    match.is_threat = true;
    match.threat_type = rule.category;
    match.pattern_matched = rule.pattern;
    match.excerpt =
        common::truncate_utf8(std::string(text.substr(begin, end - begin)), kMaxThreatContentBytes);
    return match;
  }

  if (has_suspicious_structure(text)) {
    PatternMatch match;
    match.is_threat = true;
    match.threat_type = "SUSPICIOUS_STRUCTURE";
    return match;
  }
  return {};
}

std::string normalize_homoglyphs(const std::string_view content) {
  std::string output;
  output.reserve(content.size());
  std::size_t index = 0;
  while (index < content.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    if (!decode_utf8_codepoint(content, index, cp)) {
      break;
    }
    const char folded = cp >= 0x80U ? fold_codepoint(cp) : 0;
    if (folded != 0) {
      output.push_back(folded);
    } else {
      output.append(content.substr(start, index - start));
    }
  }
  return output;
}

bool has_suspicious_structure(const std::string_view text) {
  const std::string lowered = common::to_lower(std::string(text));
  if (common::count_occurrences(lowered, "ignore") > 2) {
    return true;
  }

  std::size_t length = 0;
  std::size_t upper = 0;
  std::size_t special = 0;
  std::size_t index = 0;
  std::uint32_t cp = 0;
  while (decode_utf8_codepoint(text, index, cp)) {
    ++length;
    if (is_uppercase_codepoint(cp)) {
      ++upper;
    }
    if (cp >= 0x80U) {
      continue;
    }
    const auto ch = static_cast<unsigned char>(cp);
    if (std::isalnum(ch) == 0 && std::isspace(ch) == 0) {
      ++special;
    }
  }

  if (length > 20 && static_cast<double>(upper) / static_cast<double>(length) > 0.5) {
    return true;
  }
  for (const auto &marker : kHiddenSpanMarkers) {
    if (lowered.find(marker) != std::string::npos) {
      return true;
    }
  }
  if (length > 50 && static_cast<double>(special) / static_cast<double>(length) > 0.3) {
    return true;
  }
  return false;
}

} // namespace toolwarden::security
