#pragma once

#include "toolwarden/common/result.hpp"
#include "toolwarden/config/schema.hpp"
#include "toolwarden/gateway/dispatch_gateway.hpp"
#include "toolwarden/http/client.hpp"
#include "toolwarden/security/alert_dispatcher.hpp"
#include "toolwarden/security/behavior_monitor.hpp"
#include "toolwarden/security/sanitizer.hpp"
#include "toolwarden/security/threat_scanner.hpp"
#include "toolwarden/tools/tool_registry.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolwarden::runtime {

/// Injectable collaborators for SecurityService::create.
struct SecurityServiceDependencies {
  std::shared_ptr<http::HttpClient> http_client;
  std::shared_ptr<security::IMlClassifier> classifier;
  bool install_observer = true;
};

/// Builds every security component from one Config and owns them for the life of the
/// process. The monitor is created once here and injected into the gateway.
class SecurityService {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

public:
  using Dependencies = SecurityServiceDependencies;

  [[nodiscard]] static common::Result<std::shared_ptr<SecurityService>>
  create(config::Config config, Dependencies dependencies = {});

  SecurityService(PrivateTag, config::Config config);
  ~SecurityService();

  SecurityService(const SecurityService &) = delete;
  SecurityService &operator=(const SecurityService &) = delete;

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

  [[nodiscard]] tools::ToolRegistry &registry() { return registry_; }
  [[nodiscard]] gateway::DispatchGateway &gateway() { return *gateway_; }
  [[nodiscard]] std::shared_ptr<const security::ThreatScanner> scanner() const { return scanner_; }
  [[nodiscard]] std::shared_ptr<const security::ResponseSanitizer> sanitizer() const {
    return sanitizer_;
  }
  [[nodiscard]] std::shared_ptr<security::BehaviorMonitor> monitor() const { return monitor_; }
  [[nodiscard]] std::shared_ptr<security::AlertDispatcher> dispatcher() const { return dispatcher_; }

  /// JSON array of the newest alerts, newest first.
  [[nodiscard]] std::string list_recent_alerts_json(std::size_t limit) const;

  /// `{safe, sanitized, threats, scan_timestamp}` for ad-hoc text.
  [[nodiscard]] std::string scan_text_json(const std::string &text,
                                           const std::optional<std::string> &context) const;

private:
  config::Config config_;
  std::vector<std::string> warnings_;
  tools::ToolRegistry registry_;
  std::shared_ptr<const security::ThreatScanner> scanner_;
  std::shared_ptr<const security::ResponseSanitizer> sanitizer_;
  std::shared_ptr<security::AlertDispatcher> dispatcher_;
  std::shared_ptr<security::BehaviorMonitor> monitor_;
  std::unique_ptr<gateway::DispatchGateway> gateway_;
};

} // namespace toolwarden::runtime
