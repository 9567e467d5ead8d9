#pragma once

#include "toolwarden/config/schema.hpp"
#include "toolwarden/security/behavior_monitor.hpp"
#include "toolwarden/security/sanitizer.hpp"
#include "toolwarden/security/threat_scanner.hpp"
#include "toolwarden/tools/tool_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolwarden::gateway {

enum class DispatchStage { Received, ArgScanned, Blocked, Executing, ResponseScanned, Delivered };

enum class InvocationStatus { Ok, Blocked, UnknownTool, ToolError, InternalError };

[[nodiscard]] std::string dispatch_stage_to_string(DispatchStage stage);
[[nodiscard]] std::string invocation_status_to_string(InvocationStatus status);

inline constexpr const char *kBlockedArgumentsMessage =
    "Security Error: Tool execution blocked due to detected security threat in arguments.";

struct ToolInvocation {
  std::string tool_name;
  tools::ToolArgs arguments;
  std::optional<std::string> principal_id;
};

struct InvocationResult {
  InvocationStatus status = InvocationStatus::Ok;
  std::vector<tools::ContentUnit> content;
  /// Last stage the invocation reached.
  DispatchStage stage = DispatchStage::Received;

  [[nodiscard]] bool ok() const { return status == InvocationStatus::Ok; }
  /// Text units joined with a single space.
  [[nodiscard]] std::string text() const;
};

/// Security gate around tool invocation: scans arguments, blocks on HIGH/CRITICAL
/// findings, records usage, then scans and sanitizes every response text unit.
class DispatchGateway {
public:
  struct Dependencies {
    std::shared_ptr<const security::ThreatScanner> scanner;
    std::shared_ptr<const security::ResponseSanitizer> sanitizer;
    std::shared_ptr<security::BehaviorMonitor> monitor;
  };

  DispatchGateway(tools::ToolRegistry &registry, config::SecurityConfig config,
                  Dependencies dependencies = {});

  [[nodiscard]] InvocationResult dispatch(const ToolInvocation &invocation);

  /// Registered schemas. Unsafe schemas are logged and, with hide_unsafe_tools, omitted.
  [[nodiscard]] std::vector<tools::ToolSchema> list_tools() const;

  [[nodiscard]] const config::SecurityConfig &config() const { return config_; }

private:
  [[nodiscard]] std::optional<InvocationResult> check_arguments(const ToolInvocation &invocation,
                                                                const std::string &principal) const;
  void screen_response(const std::string &tool_name, std::vector<tools::ContentUnit> &content) const;
  void alert_threats(const std::string &tool_name, const std::string &where,
                     const security::ScanResult &result,
                     const std::optional<std::string> &principal) const;

  tools::ToolRegistry &registry_;
  config::SecurityConfig config_;
  Dependencies dependencies_;
};

/// Invocation principal, else the `agent_id` or `token` argument, else "unknown".
[[nodiscard]] std::string resolve_principal(const ToolInvocation &invocation);

} // namespace toolwarden::gateway
