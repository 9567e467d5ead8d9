#include "toolwarden/runtime/security_service.hpp"

#include "toolwarden/config/config.hpp"
#include "toolwarden/observability/factory.hpp"
#include "toolwarden/observability/global.hpp"

#include <chrono>

namespace toolwarden::runtime {

SecurityService::SecurityService(PrivateTag, config::Config config) : config_(std::move(config)) {}

SecurityService::~SecurityService() {
  if (dispatcher_ != nullptr) {
    dispatcher_->stop();
  }
}

common::Result<std::shared_ptr<SecurityService>>
SecurityService::create(config::Config config, Dependencies dependencies) {
  using R = common::Result<std::shared_ptr<SecurityService>>;

  if (dependencies.install_observer) {
    observability::set_global_observer(observability::create_observer(config));
  }

  auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return R::failure(validated.error());
  }

  const auto mode = security::sanitization_mode_from_string(config.security.sanitization_mode);
  if (!mode.ok()) {
    return R::failure(mode.error());
  }

  auto service = std::make_shared<SecurityService>(PrivateTag{}, std::move(config));
  service->warnings_ = std::move(validated.value());
  for (const auto &warning : service->warnings_) {
    observability::record_warning("config", warning);
  }

  const auto &security_config = service->config_.security;
  const auto &monitor_config = service->config_.monitor;

  auto matcher = security::PatternMatcher::create(
      security::PatternMatcher::default_rules(),
      std::chrono::milliseconds(security_config.pattern_time_budget_ms));
  if (!matcher.ok()) {
    return R::failure(matcher.error());
  }

  std::shared_ptr<security::IMlClassifier> classifier;
  if (security_config.use_ml_detection) {
    if (dependencies.classifier == nullptr) {
      observability::record_warning("config",
                                    "security.use_ml_detection is set but no classifier is available");
    }
    classifier = std::move(dependencies.classifier);
  }

  service->scanner_ = std::make_shared<const security::ThreatScanner>(
      std::make_shared<const security::PatternMatcher>(std::move(matcher.value())),
      std::move(classifier));
  service->sanitizer_ = std::make_shared<const security::ResponseSanitizer>(mode.value());

  auto http_client = dependencies.http_client;
  if (http_client == nullptr) {
    http_client = std::make_shared<http::CurlHttpClient>();
  }
  service->dispatcher_ = std::make_shared<security::AlertDispatcher>(
      std::move(http_client),
      security::AlertDispatcherOptions{.timeout_ms = monitor_config.webhook_timeout_ms,
                                       .queue_capacity = monitor_config.webhook_queue_capacity});

  service->monitor_ = std::make_shared<security::BehaviorMonitor>(
      security::MonitorThresholds::from_config(monitor_config), service->dispatcher_);
  if (security_config.alert_webhook_url.has_value()) {
    const auto status = service->monitor_->set_alert_webhook(*security_config.alert_webhook_url);
    if (!status.ok()) {
      return R::failure("security.alert_webhook_url: " + status.error());
    }
  }

  service->gateway_ = std::make_unique<gateway::DispatchGateway>(
      service->registry_, security_config,
      gateway::DispatchGateway::Dependencies{.scanner = service->scanner_,
                                             .sanitizer = service->sanitizer_,
                                             .monitor = service->monitor_});

  return R::success(std::move(service));
}

std::string SecurityService::list_recent_alerts_json(const std::size_t limit) const {
  std::string out = "[";
  bool first = true;
  for (const auto &alert : monitor_->get_recent_alerts(limit)) {
    if (!first) {
      out += ",";
    }
    first = false;
    out += security::alert_to_json(alert);
  }
  out += "]";
  return out;
}

std::string SecurityService::scan_text_json(const std::string &text,
                                            const std::optional<std::string> &context) const {
  return security::scan_result_to_json(scanner_->scan_text(text, context));
}

} // namespace toolwarden::runtime
