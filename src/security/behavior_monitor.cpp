#include "toolwarden/security/behavior_monitor.hpp"

#include "toolwarden/common/hash.hpp"
#include "toolwarden/common/json_util.hpp"
#include "toolwarden/common/strings.hpp"
#include "toolwarden/config/config.hpp"
#include "toolwarden/observability/global.hpp"

#include <algorithm>
#include <map>

namespace toolwarden::security {

MonitorThresholds MonitorThresholds::from_config(const config::MonitorConfig &config) {
  return MonitorThresholds{.history_capacity = config.history_capacity,
                           .min_history = config.min_history,
                           .max_calls_per_window = config.max_calls_per_window,
                           .max_response_size = config.max_response_size,
                           .max_identical_calls = config.max_identical_calls,
                           .window = std::chrono::seconds(config.window_seconds),
                           .alert_log_capacity = config.alert_log_capacity};
}

BehaviorMonitor::BehaviorMonitor(MonitorThresholds thresholds,
                                 std::shared_ptr<AlertDispatcher> dispatcher)
    : thresholds_(thresholds), dispatcher_(std::move(dispatcher)),
      alerts_(thresholds.alert_log_capacity) {
  thresholds_.history_capacity = std::max<std::size_t>(1, thresholds_.history_capacity);
}

std::string BehaviorMonitor::hash_params(const std::unordered_map<std::string, std::string> &params) {
  const std::map<std::string, std::string> sorted(params.begin(), params.end());
  return common::sha256_hex(common::json_render_object(sorted));
}

std::shared_ptr<BehaviorMonitor::History>
BehaviorMonitor::history_for(const std::string &principal_id) {
  std::lock_guard<std::mutex> lock(histories_mutex_);
  auto &slot = histories_[principal_id];
  if (slot == nullptr) {
    slot = std::make_shared<History>();
  }
  return slot;
}

std::optional<SecurityAlert>
BehaviorMonitor::track(const std::string &principal_id, const std::string &tool_name,
                       const std::unordered_map<std::string, std::string> &params,
                       const std::string &response) {
  return track_at(std::chrono::system_clock::now(), principal_id, tool_name, params, response);
}

std::optional<SecurityAlert>
BehaviorMonitor::track_at(const std::chrono::system_clock::time_point now,
                          const std::string &principal_id, const std::string &tool_name,
                          const std::unordered_map<std::string, std::string> &params,
                          const std::string &response) {
  ToolUsageRecord record{.principal_id = principal_id,
                         .tool_name = tool_name,
                         .timestamp = now,
                         .params_hash = hash_params(params),
                         .response_size = response.size()};

  std::optional<std::string> anomaly;
  {
    auto history = history_for(principal_id);
    std::lock_guard<std::mutex> lock(history->mutex);
    history->records.push_back(record);
    while (history->records.size() > thresholds_.history_capacity) {
      history->records.pop_front();
    }
    anomaly = detect_anomaly(history->records, now);
  }
  if (!anomaly.has_value()) {
    return std::nullopt;
  }

  SecurityAlert alert;
  alert.severity = Severity::High;
  alert.message = "Anomalous tool usage detected for agent " + principal_id;
  alert.details["tool_name"] = tool_name;
  alert.details["response_size"] = static_cast<std::int64_t>(record.response_size);
  alert.details["params_hash"] = record.params_hash;
  alert.details["anomaly"] = *anomaly;
  alert.timestamp = now;
  alert.principal_id = principal_id;
  alert.tool_name = tool_name;

  raise_alert(alert);
  return alert;
}

std::optional<std::string>
BehaviorMonitor::detect_anomaly(const std::deque<ToolUsageRecord> &records,
                                const std::chrono::system_clock::time_point now) const {
  if (records.empty() || records.size() < thresholds_.min_history) {
    return std::nullopt;
  }
  const ToolUsageRecord &current = records.back();

  std::size_t recent_calls = 0;
  std::size_t identical_calls = 0;
  for (const auto &record : records) {
    if (now - record.timestamp >= thresholds_.window) {
      continue;
    }
    ++recent_calls;
    if (record.tool_name == current.tool_name && record.params_hash == current.params_hash) {
      ++identical_calls;
    }
  }
  if (recent_calls > thresholds_.max_calls_per_window) {
    return std::string("frequency");
  }

  if (records.size() > thresholds_.min_history) {
    const bool seen_before =
        std::any_of(records.begin(), records.end() - 1,
                    [&current](const auto &record) { return record.tool_name == current.tool_name; });
    if (!seen_before) {
      return std::string("novel_tool");
    }
  }

  if (current.response_size > thresholds_.max_response_size) {
    return std::string("response_size");
  }

  if (identical_calls > thresholds_.max_identical_calls) {
    return std::string("repetition");
  }
  return std::nullopt;
}

void BehaviorMonitor::raise_alert(SecurityAlert alert) {
  observability::record_security_alert(severity_to_string(alert.severity), alert.message);

  const auto webhook = alert_webhook();
  std::string body;
  if (webhook.has_value() && dispatcher_ != nullptr) {
    body = alert_to_json(alert);
  }

  alerts_.push(std::move(alert));
  observability::record_metric(
      observability::AlertLogSizeMetric{.size = alerts_.size(), .dropped = alerts_.dropped()});

  if (!webhook.has_value()) {
    return;
  }
  if (dispatcher_ == nullptr) {
    observability::record_delivery(*webhook, false, "no alert dispatcher configured");
    return;
  }
  dispatcher_->enqueue(*webhook, std::move(body));
}

std::vector<SecurityAlert> BehaviorMonitor::get_recent_alerts(const std::size_t limit) const {
  return alerts_.recent(limit);
}

common::Status BehaviorMonitor::set_alert_webhook(const std::string &url) {
  const std::string trimmed = common::trim(url);
  const auto status = config::validate_webhook_url(trimmed);
  if (!status.ok()) {
    return status;
  }
  std::lock_guard<std::mutex> lock(webhook_mutex_);
  webhook_url_ = trimmed;
  return common::Status::success();
}

void BehaviorMonitor::clear_alert_webhook() {
  std::lock_guard<std::mutex> lock(webhook_mutex_);
  webhook_url_ = std::nullopt;
}

std::optional<std::string> BehaviorMonitor::alert_webhook() const {
  std::lock_guard<std::mutex> lock(webhook_mutex_);
  return webhook_url_;
}

std::size_t BehaviorMonitor::history_size(const std::string &principal_id) const {
  std::shared_ptr<History> history;
  {
    std::lock_guard<std::mutex> lock(histories_mutex_);
    const auto it = histories_.find(principal_id);
    if (it == histories_.end()) {
      return 0;
    }
    history = it->second;
  }
  std::lock_guard<std::mutex> lock(history->mutex);
  return history->records.size();
}

} // namespace toolwarden::security
