#pragma once

#include "toolwarden/observability/observer.hpp"

#include <memory>

namespace toolwarden::observability {

/// Process-wide sink used by the security components for logging. A null observer
/// silently discards everything.
void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_threat(const std::string &location, const std::string &threat_type,
                   const std::string &severity);
void record_tool_blocked(const std::string &tool, const std::string &principal,
                         const std::string &reason);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_security_alert(const std::string &severity, const std::string &message);
void record_delivery(const std::string &target, bool delivered, const std::string &detail = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace toolwarden::observability
