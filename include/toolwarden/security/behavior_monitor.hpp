#pragma once

#include "toolwarden/common/result.hpp"
#include "toolwarden/config/schema.hpp"
#include "toolwarden/security/alert_dispatcher.hpp"
#include "toolwarden/security/alert_log.hpp"
#include "toolwarden/security/threat.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolwarden::security {

struct MonitorThresholds {
  std::size_t history_capacity = 1000;
  std::size_t min_history = 10;
  std::size_t max_calls_per_window = 50;
  std::size_t max_response_size = 100'000;
  std::size_t max_identical_calls = 10;
  std::chrono::seconds window{60};
  std::size_t alert_log_capacity = 500;

  [[nodiscard]] static MonitorThresholds from_config(const config::MonitorConfig &config);
};

/// Tracks tool usage per principal and raises alerts on anomalous behavior.
class BehaviorMonitor {
public:
  explicit BehaviorMonitor(MonitorThresholds thresholds = {},
                           std::shared_ptr<AlertDispatcher> dispatcher = nullptr);

  /// Records one successful call. Returns the alert when the call was anomalous.
  std::optional<SecurityAlert> track(const std::string &principal_id, const std::string &tool_name,
                                     const std::unordered_map<std::string, std::string> &params,
                                     const std::string &response);
  std::optional<SecurityAlert> track_at(std::chrono::system_clock::time_point now,
                                        const std::string &principal_id,
                                        const std::string &tool_name,
                                        const std::unordered_map<std::string, std::string> &params,
                                        const std::string &response);

  /// Logs an alert produced elsewhere and forwards it to the webhook.
  void raise_alert(SecurityAlert alert);

  [[nodiscard]] std::vector<SecurityAlert> get_recent_alerts(std::size_t limit = 10) const;

  common::Status set_alert_webhook(const std::string &url);
  void clear_alert_webhook();
  [[nodiscard]] std::optional<std::string> alert_webhook() const;

  [[nodiscard]] std::size_t history_size(const std::string &principal_id) const;
  [[nodiscard]] const MonitorThresholds &thresholds() const { return thresholds_; }
  [[nodiscard]] const AlertLog &alert_log() const { return alerts_; }

  /// Hash of the key-sorted JSON rendering of `params`.
  [[nodiscard]] static std::string hash_params(
      const std::unordered_map<std::string, std::string> &params);

private:
  struct History {
    std::mutex mutex;
    std::deque<ToolUsageRecord> records;
  };

  std::shared_ptr<History> history_for(const std::string &principal_id);
  [[nodiscard]] std::optional<std::string> detect_anomaly(const std::deque<ToolUsageRecord> &records,
                                                          std::chrono::system_clock::time_point now) const;

  MonitorThresholds thresholds_;
  std::shared_ptr<AlertDispatcher> dispatcher_;

  mutable std::mutex histories_mutex_;
  std::unordered_map<std::string, std::shared_ptr<History>> histories_;

  AlertLog alerts_;

  mutable std::mutex webhook_mutex_;
  std::optional<std::string> webhook_url_;
};

} // namespace toolwarden::security
