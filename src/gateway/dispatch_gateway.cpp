#include "toolwarden/gateway/dispatch_gateway.hpp"

#include "toolwarden/common/json_util.hpp"
#include "toolwarden/common/strings.hpp"
#include "toolwarden/observability/global.hpp"

#include <chrono>
#include <exception>
#include <map>

namespace toolwarden::gateway {

namespace {

std::string join_types(const security::ScanResult &result) {
  std::string out;
  for (const auto &type : result.threat_types()) {
    if (!out.empty()) {
      out += ",";
    }
    out += type;
  }
  return out;
}

std::string join_text(const std::vector<tools::ContentUnit> &content) {
  std::string out;
  bool first = true;
  for (const auto &unit : content) {
    if (unit.type != "text") {
      continue;
    }
    if (!first) {
      out += " ";
    }
    first = false;
    out += unit.text;
  }
  return out;
}

InvocationResult single_text(const InvocationStatus status, const DispatchStage stage,
                             std::string text) {
  InvocationResult result;
  result.status = status;
  result.stage = stage;
  result.content.push_back(tools::ContentUnit{.type = "text", .text = std::move(text)});
  return result;
}

} // namespace

std::string dispatch_stage_to_string(const DispatchStage stage) {
  switch (stage) {
  case DispatchStage::Received:
    return "RECEIVED";
  case DispatchStage::ArgScanned:
    return "ARG_SCANNED";
  case DispatchStage::Blocked:
    return "BLOCKED";
  case DispatchStage::Executing:
    return "EXECUTING";
  case DispatchStage::ResponseScanned:
    return "RESPONSE_SCANNED";
  case DispatchStage::Delivered:
    return "DELIVERED";
  }
  return "RECEIVED";
}

std::string invocation_status_to_string(const InvocationStatus status) {
  switch (status) {
  case InvocationStatus::Ok:
    return "ok";
  case InvocationStatus::Blocked:
    return "blocked";
  case InvocationStatus::UnknownTool:
    return "unknown_tool";
  case InvocationStatus::ToolError:
    return "tool_error";
  case InvocationStatus::InternalError:
    return "internal_error";
  }
  return "internal_error";
}

std::string InvocationResult::text() const { return join_text(content); }

std::string resolve_principal(const ToolInvocation &invocation) {
  if (invocation.principal_id.has_value() && !common::trim(*invocation.principal_id).empty()) {
    return *invocation.principal_id;
  }
  for (const char *key : {"agent_id", "token"}) {
    const auto it = invocation.arguments.find(key);
    if (it != invocation.arguments.end() && !it->second.empty()) {
      return it->second;
    }
  }
  return "unknown";
}

DispatchGateway::DispatchGateway(tools::ToolRegistry &registry, config::SecurityConfig config,
                                 Dependencies dependencies)
    : registry_(registry), config_(std::move(config)), dependencies_(std::move(dependencies)) {
  if (dependencies_.scanner == nullptr) {
    dependencies_.scanner = std::make_shared<const security::ThreatScanner>(
        std::make_shared<const security::PatternMatcher>(
            std::chrono::milliseconds(config_.pattern_time_budget_ms)));
  }
  if (dependencies_.sanitizer == nullptr) {
    const auto mode = security::sanitization_mode_from_string(config_.sanitization_mode);
    if (!mode.ok()) {
      observability::record_warning("gateway", mode.error() + "; falling back to remove");
    }
    dependencies_.sanitizer = std::make_shared<const security::ResponseSanitizer>(
        mode.value_or(security::SanitizationMode::Remove));
  }
}

InvocationResult DispatchGateway::dispatch(const ToolInvocation &invocation) {
  const auto started = std::chrono::steady_clock::now();

  tools::ITool *tool = registry_.get_tool(invocation.tool_name);
  if (tool == nullptr) {
    observability::record_warning("gateway", "unknown tool called: " + invocation.tool_name);
    return single_text(InvocationStatus::UnknownTool, DispatchStage::Received,
                       "Error: Unknown tool '" + invocation.tool_name + "'.");
  }
  const std::string tool_name(tool->name());
  const std::string principal = resolve_principal(invocation);

  if (config_.enabled) {
    if (auto refusal = check_arguments(invocation, principal); refusal.has_value()) {
      return std::move(*refusal);
    }
  }

  InvocationResult result;
  result.stage = DispatchStage::Executing;
  try {
    auto executed =
        tool->execute(invocation.arguments, tools::ToolContext{.principal_id = principal});
    if (!executed.ok()) {
      result.status = InvocationStatus::ToolError;
      result.content.push_back(tools::ContentUnit{.type = "text", .text = executed.error()});
    } else {
      result.status = executed.value().success ? InvocationStatus::Ok : InvocationStatus::ToolError;
      result.content = std::move(executed.value().content);
    }
  } catch (const std::exception &e) {
    observability::record_error("gateway",
                                "error executing tool '" + tool_name + "': " + e.what());
    observability::record_tool_call(
        tool_name,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                              started),
        false);
    return single_text(InvocationStatus::InternalError, DispatchStage::Executing,
                       "Internal error executing tool '" + tool_name + "'.");
  }

  observability::record_tool_call(
      tool_name,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      result.status == InvocationStatus::Ok);

  if (!config_.enabled) {
    if (result.status == InvocationStatus::Ok) {
      result.stage = DispatchStage::Delivered;
    }
    return result;
  }

  if (result.status == InvocationStatus::Ok && dependencies_.monitor != nullptr) {
    try {
      dependencies_.monitor->track(principal, tool_name, invocation.arguments,
                                   join_text(result.content));
    } catch (const std::exception &e) {
      observability::record_error("gateway",
                                  "usage tracking failed for '" + tool_name + "': " + e.what());
    }
  }

  if (config_.scan_tool_responses) {
    screen_response(tool_name, result.content);
    result.stage = DispatchStage::ResponseScanned;
  }
  if (result.status == InvocationStatus::Ok) {
    result.stage = DispatchStage::Delivered;
  }
  return result;
}

std::optional<InvocationResult> DispatchGateway::check_arguments(const ToolInvocation &invocation,
                                                                 const std::string &principal) const {
  const std::map<std::string, std::string> sorted(invocation.arguments.begin(),
                                                  invocation.arguments.end());
  const std::string context = "tool." + invocation.tool_name + ".arguments";

  security::ScanResult scan;
  try {
    scan = dependencies_.scanner->scan_text(common::json_render_object(sorted), context);
  } catch (const std::exception &e) {
    observability::record_error("gateway", "argument scan failed for '" + invocation.tool_name +
                                               "': " + e.what());
    if (!config_.fail_closed) {
      return std::nullopt;
    }
    observability::record_tool_blocked(invocation.tool_name, principal, "argument scan failed");
    return single_text(InvocationStatus::Blocked, DispatchStage::Blocked, kBlockedArgumentsMessage);
  }

  if (scan.safe()) {
    return std::nullopt;
  }
  observability::record_warning("gateway", "tool arguments for '" + invocation.tool_name +
                                               "' contained threats: " + join_types(scan));
  if (!scan.has_high_or_critical()) {
    return std::nullopt;
  }

  alert_threats(invocation.tool_name, "arguments", scan, principal);
  observability::record_tool_blocked(invocation.tool_name, principal, join_types(scan));
  return single_text(InvocationStatus::Blocked, DispatchStage::Blocked, kBlockedArgumentsMessage);
}

void DispatchGateway::screen_response(const std::string &tool_name,
                                      std::vector<tools::ContentUnit> &content) const {
  for (auto &unit : content) {
    if (unit.type != "text") {
      continue;
    }
    try {
      auto scan = dependencies_.scanner->scan_tool_response(unit.text);
      if (scan.safe()) {
        continue;
      }
      observability::record_warning("gateway", "tool response from '" + tool_name +
                                                   "' contained threats: " + join_types(scan));
      alert_threats(tool_name, "response", scan, std::nullopt);
      unit.text = dependencies_.sanitizer->sanitize(unit.text, scan);
    } catch (const std::exception &e) {
      observability::record_error("gateway", "response screening failed for '" + tool_name +
                                                 "': " + e.what());
      if (config_.fail_closed) {
        unit.text = security::kBlockedContent;
      }
    }
  }
}

void DispatchGateway::alert_threats(const std::string &tool_name, const std::string &where,
                                    const security::ScanResult &result,
                                    const std::optional<std::string> &principal) const {
  security::SecurityAlert alert;
  alert.severity = security::Severity::High;
  alert.message = "Security threat detected in tool " + where + " for '" + tool_name + "'";
  alert.details["tool_name"] = tool_name;
  alert.details["threats"] = result.threat_types();
  alert.details["threat_count"] = static_cast<std::int64_t>(result.threats.size());
  alert.tool_name = tool_name;
  alert.principal_id = principal;

  if (dependencies_.monitor != nullptr) {
    dependencies_.monitor->raise_alert(std::move(alert));
  } else {
    observability::record_security_alert("HIGH", alert.message);
  }
}

std::vector<tools::ToolSchema> DispatchGateway::list_tools() const {
  std::vector<tools::ToolSchema> listed;
  for (auto &schema : registry_.all_schemas()) {
    if (config_.enabled && config_.scan_tool_schemas) {
      const auto scan = dependencies_.scanner->scan_tool_schema(schema);
      if (!scan.safe()) {
        observability::record_warning("gateway", "tool '" + schema.name +
                                                     "' schema contained threats: " +
                                                     join_types(scan));
        if (config_.hide_unsafe_tools) {
          continue;
        }
      }
    }
    listed.push_back(std::move(schema));
  }
  return listed;
}

} // namespace toolwarden::gateway
