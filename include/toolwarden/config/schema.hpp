#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace toolwarden::config {

struct SecurityConfig {
  bool enabled = true;
  bool scan_tool_schemas = true;
  bool scan_tool_responses = true;
  std::string sanitization_mode = "remove";
  std::optional<std::string> alert_webhook_url;
  bool fail_closed = false;
  bool hide_unsafe_tools = false;
  bool use_ml_detection = false;
  std::uint64_t pattern_time_budget_ms = 250;
};

struct MonitorConfig {
  std::size_t history_capacity = 1000;
  std::size_t min_history = 10;
  std::size_t max_calls_per_window = 50;
  std::size_t max_response_size = 100'000;
  std::size_t max_identical_calls = 10;
  std::uint64_t window_seconds = 60;
  std::size_t alert_log_capacity = 500;
  std::uint64_t webhook_timeout_ms = 5'000;
  std::size_t webhook_queue_capacity = 256;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  SecurityConfig security;
  MonitorConfig monitor;
  ObservabilityConfig observability;
};

} // namespace toolwarden::config
