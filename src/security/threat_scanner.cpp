#include "toolwarden/security/threat_scanner.hpp"

#include "toolwarden/common/json_util.hpp"
#include "toolwarden/common/strings.hpp"
#include "toolwarden/observability/global.hpp"

#include <chrono>
#include <exception>

namespace toolwarden::security {

namespace {

Threat make_threat(std::string type, const Severity severity, std::optional<std::string> location,
                   const std::string &content, const PatternMatch &match) {
  Threat threat;
  threat.type = std::move(type);
  threat.severity = severity;
  threat.location = std::move(location);
  threat.content = common::truncate_utf8(content, kMaxThreatContentBytes);
  threat.pattern_matched = match.pattern_matched;
  threat.excerpt = match.excerpt;
  return threat;
}

void add_diagnostic(ScanResult &result, const std::string &check, const std::string &message) {
  result.diagnostics.push_back(ScanDiagnostic{.check = check, .message = message});
  observability::record_warning("scanner", check + ": " + message);
}

void report(const ScanResult &result, const std::string &scope,
            const std::chrono::steady_clock::time_point started) {
  for (const auto &threat : result.threats) {
    observability::record_threat(threat.location.value_or(scope), threat.type,
                                 severity_to_string(threat.severity));
  }
  observability::record_metric(observability::ScanLatencyMetric{
      .scope = scope,
      .latency = std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - started)});
}

} // namespace

ThreatScanner::ThreatScanner(std::shared_ptr<const PatternMatcher> matcher,
                             std::shared_ptr<IMlClassifier> classifier)
    : matcher_(matcher != nullptr ? std::move(matcher) : std::make_shared<const PatternMatcher>()),
      classifier_(std::move(classifier)) {}

std::optional<PatternMatch> ThreatScanner::match(const std::string &text, const std::string &check,
                                                 ScanResult &result) const {
  PatternMatch found = matcher_->contains_injection(text);
  if (found.error.has_value()) {
    add_diagnostic(result, check, "pattern matcher failed: " + *found.error);
    return std::nullopt;
  }
  if (found.budget_exhausted) {
    add_diagnostic(result, check, "pattern time budget exhausted");
    return std::nullopt;
  }
  if (!found.is_threat) {
    return std::nullopt;
  }
  return found;
}

ScanResult ThreatScanner::scan_text(const std::string &text,
                                    const std::optional<std::string> &context) const {
  const auto started = std::chrono::steady_clock::now();
  ScanResult result;
  if (const auto found = match(text, "text", result); found.has_value()) {
    result.threats.push_back(make_threat(found->threat_type.value_or("TEXT_POISON"),
                                         Severity::High, context, text, *found));
  }
  report(result, "text", started);
  return result;
}

ScanResult ThreatScanner::scan_tool_schema(const tools::ToolSchema &schema) const {
  const auto started = std::chrono::steady_clock::now();
  ScanResult result;

  if (!schema.description.empty()) {
    if (const auto found = match(schema.description, "tool.description", result);
        found.has_value()) {
      result.threats.push_back(make_threat("TOOL_DESCRIPTION_POISON", Severity::High,
                                           "tool.description", schema.description, *found));
    }
  }

  const std::string parameters = common::trim(schema.parameters_json);
  if (!parameters.empty()) {
    if (parameters.front() != '{') {
      add_diagnostic(result, "tool.parameters", "parameters are not a JSON object");
    } else {
      const auto top = common::json_parse_flat(parameters);
      const auto properties_it = top.find("properties");
      if (properties_it != top.end() && !properties_it->second.empty() &&
          properties_it->second.front() == '{') {
        for (const auto &[param_name, param_json] : common::json_parse_entries(properties_it->second)) {
          if (param_json.empty() || param_json.front() != '{') {
            continue;
          }
          const auto definition = common::json_parse_flat(param_json);
          const std::string location = "parameter." + param_name;

          if (const auto desc = definition.find("description");
              desc != definition.end() && !desc->second.empty()) {
            if (const auto found = match(desc->second, location, result); found.has_value()) {
              result.threats.push_back(make_threat("PARAMETER_DESCRIPTION_POISON",
                                                   Severity::Medium, location, desc->second,
                                                   *found));
            }
          }

          const auto examples = definition.find("examples");
          if (examples == definition.end() || examples->second.empty() ||
              examples->second.front() != '[') {
            continue;
          }
          const auto items = common::json_split_array(examples->second);
          for (std::size_t i = 0; i < items.size(); ++i) {
            const std::string example_location =
                location + ".examples[" + std::to_string(i) + "]";
            if (const auto found = match(items[i], example_location, result); found.has_value()) {
              result.threats.push_back(make_threat("PARAMETER_EXAMPLE_POISON", Severity::Medium,
                                                   example_location, items[i], *found));
            }
          }
        }
      }
    }
  }

  report(result, "tool." + schema.name, started);
  return result;
}

ScanResult ThreatScanner::scan_tool_response(const std::string &response) const {
  const auto started = std::chrono::steady_clock::now();
  ScanResult result;
  if (const auto found = match(response, "response", result); found.has_value()) {
    result.threats.push_back(
        make_threat("RESPONSE_CONTENT_POISON", Severity::High, std::nullopt, response, *found));
  }
  run_classifier(response, result);
  report(result, "response", started);
  return result;
}

void ThreatScanner::run_classifier(const std::string &text, ScanResult &result) const {
  if (classifier_ == nullptr || !classifier_->enabled()) {
    return;
  }
  try {
    const auto verdict = classifier_->classify(text);
    if (!verdict.ok()) {
      add_diagnostic(result, "ml", "ML detection failed: " + verdict.error());
      return;
    }
    if (verdict.value().is_threat) {
      Threat threat;
      threat.type = "ML_DETECTED_POISON";
      threat.severity = Severity::High;
      threat.confidence = verdict.value().confidence;
      result.threats.push_back(std::move(threat));
    }
  } catch (const std::exception &e) {
    add_diagnostic(result, "ml", std::string("ML detection failed: ") + e.what());
  }
}

} // namespace toolwarden::security
