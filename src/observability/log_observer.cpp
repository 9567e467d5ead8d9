#include "toolwarden/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace toolwarden::observability {

namespace {

void log_line(const std::string &level, const std::string &message) {
  std::cerr << "[" << level << "] " << message << "\n";
}

} // namespace

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ThreatDetectedEvent>) {
          log_line("WARN", "threat.detected type=" + evt.threat_type + " severity=" +
                               evt.severity + " location=" + evt.location);
        } else if constexpr (std::is_same_v<T, ToolBlockedEvent>) {
          log_line("ERROR", "tool.blocked name=" + evt.tool + " principal=" + evt.principal +
                                " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line("INFO", "tool.call name=" + evt.tool +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, SecurityAlertEvent>) {
          log_line("WARN", "security.alert severity=" + evt.severity + " " + evt.message);
        } else if constexpr (std::is_same_v<T, DeliveryEvent>) {
          if (evt.delivered) {
            log_line("DEBUG", "alert.delivered target=" + evt.target);
          } else {
            log_line("ERROR", "alert.delivery_failed target=" + evt.target + ": " + evt.detail);
          }
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::visit(
      [](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line("DEBUG", "metric.scan_latency_us scope=" + m.scope + " value=" +
                                std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, AlertLogSizeMetric>) {
          log_line("DEBUG", "metric.alert_log size=" + std::to_string(m.size) +
                                " dropped=" + std::to_string(m.dropped));
        }
      },
      metric);
}

} // namespace toolwarden::observability
