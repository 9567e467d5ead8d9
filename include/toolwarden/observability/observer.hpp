#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace toolwarden::observability {

struct ThreatDetectedEvent {
  std::string location;
  std::string threat_type;
  std::string severity;
};

struct ToolBlockedEvent {
  std::string tool;
  std::string principal;
  std::string reason;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct SecurityAlertEvent {
  std::string severity;
  std::string message;
};

struct DeliveryEvent {
  std::string target;
  bool delivered = false;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ThreatDetectedEvent, ToolBlockedEvent, ToolCallEvent,
                                   SecurityAlertEvent, DeliveryEvent, WarningEvent, ErrorEvent>;

struct ScanLatencyMetric {
  std::string scope;
  std::chrono::microseconds latency{0};
};

struct AlertLogSizeMetric {
  std::uint64_t size = 0;
  std::uint64_t dropped = 0;
};

using ObserverMetric = std::variant<ScanLatencyMetric, AlertLogSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace toolwarden::observability
