#include "toolwarden/observability/global.hpp"

#include <mutex>

namespace toolwarden::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_threat(const std::string &location, const std::string &threat_type,
                   const std::string &severity) {
  record_event(ThreatDetectedEvent{
      .location = location, .threat_type = threat_type, .severity = severity});
}

void record_tool_blocked(const std::string &tool, const std::string &principal,
                         const std::string &reason) {
  record_event(ToolBlockedEvent{.tool = tool, .principal = principal, .reason = reason});
}

void record_tool_call(const std::string &tool, std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_security_alert(const std::string &severity, const std::string &message) {
  record_event(SecurityAlertEvent{.severity = severity, .message = message});
}

void record_delivery(const std::string &target, const bool delivered, const std::string &detail) {
  record_event(DeliveryEvent{.target = target, .delivered = delivered, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace toolwarden::observability
