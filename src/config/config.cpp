#include "toolwarden/config/config.hpp"

#include "toolwarden/common/strings.hpp"
#include "toolwarden/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace toolwarden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".toolwarden";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

const std::vector<std::string> kSecurityKeys = {
    "enabled",          "scan_tool_schemas", "scan_tool_responses",
    "sanitization_mode", "alert_webhook_url", "fail_closed",
    "hide_unsafe_tools", "use_ml_detection",  "pattern_time_budget_ms"};

const std::vector<std::string> kMonitorKeys = {
    "history_capacity",   "min_history",         "max_calls_per_window",
    "max_response_size",  "max_identical_calls", "window_seconds",
    "alert_log_capacity", "webhook_timeout_ms",  "webhook_queue_capacity"};

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::optional<bool> parse_env_bool(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

void load_security_config(Config &config, const common::TomlDocument &doc) {
  auto &security = config.security;
  security.enabled = doc.get_bool("security.enabled", security.enabled);
  security.scan_tool_schemas = doc.get_bool("security.scan_tool_schemas", security.scan_tool_schemas);
  security.scan_tool_responses =
      doc.get_bool("security.scan_tool_responses", security.scan_tool_responses);
  security.sanitization_mode = doc.get_string("security.sanitization_mode", security.sanitization_mode);
  if (doc.has("security.alert_webhook_url")) {
    const std::string url = common::trim(expand_config_value(doc.get_string("security.alert_webhook_url")));
    if (url.empty()) {
      security.alert_webhook_url = std::nullopt;
    } else {
      security.alert_webhook_url = url;
    }
  }
  security.fail_closed = doc.get_bool("security.fail_closed", security.fail_closed);
  security.hide_unsafe_tools = doc.get_bool("security.hide_unsafe_tools", security.hide_unsafe_tools);
  security.use_ml_detection = doc.get_bool("security.use_ml_detection", security.use_ml_detection);
  security.pattern_time_budget_ms =
      doc.get_u64("security.pattern_time_budget_ms", security.pattern_time_budget_ms);
}

void load_monitor_config(Config &config, const common::TomlDocument &doc) {
  auto &monitor = config.monitor;
  monitor.history_capacity = doc.get_u64("monitor.history_capacity", monitor.history_capacity);
  monitor.min_history = doc.get_u64("monitor.min_history", monitor.min_history);
  monitor.max_calls_per_window =
      doc.get_u64("monitor.max_calls_per_window", monitor.max_calls_per_window);
  monitor.max_response_size = doc.get_u64("monitor.max_response_size", monitor.max_response_size);
  monitor.max_identical_calls =
      doc.get_u64("monitor.max_identical_calls", monitor.max_identical_calls);
  monitor.window_seconds = doc.get_u64("monitor.window_seconds", monitor.window_seconds);
  monitor.alert_log_capacity = doc.get_u64("monitor.alert_log_capacity", monitor.alert_log_capacity);
  monitor.webhook_timeout_ms = doc.get_u64("monitor.webhook_timeout_ms", monitor.webhook_timeout_ms);
  monitor.webhook_queue_capacity =
      doc.get_u64("monitor.webhook_queue_capacity", monitor.webhook_queue_capacity);
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(*g_config_path_override);
  }
  if (const char *env = std::getenv("TOOLWARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(env)));
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

common::Result<Config> parse_config(const std::string &toml_text,
                                    std::vector<std::string> *warnings) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  load_security_config(config, doc);
  load_monitor_config(config, doc);
  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);

  if (warnings != nullptr) {
    for (const auto &key : doc.unknown_keys("security", kSecurityKeys)) {
      warnings->push_back("unknown config key: " + key);
    }
    for (const auto &key : doc.unknown_keys("monitor", kMonitorKeys)) {
      warnings->push_back("unknown config key: " + key);
    }
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }

  if (!std::filesystem::exists(path.value())) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }
  return load_config_file(path.value());
}

void apply_env_overrides(Config &config) {
  if (const auto enabled = parse_env_bool("TOOLWARDEN_SECURITY_ENABLED"); enabled.has_value()) {
    config.security.enabled = *enabled;
  }
  if (const auto schemas = parse_env_bool("TOOLWARDEN_SECURITY_SCAN_TOOL_SCHEMAS");
      schemas.has_value()) {
    config.security.scan_tool_schemas = *schemas;
  }
  if (const auto responses = parse_env_bool("TOOLWARDEN_SECURITY_SCAN_TOOL_RESPONSES");
      responses.has_value()) {
    config.security.scan_tool_responses = *responses;
  }
  if (const char *mode = std::getenv("TOOLWARDEN_SECURITY_SANITIZATION_MODE");
      mode != nullptr && *mode != '\0') {
    config.security.sanitization_mode = mode;
  }
  if (const char *webhook = std::getenv("TOOLWARDEN_SECURITY_ALERT_WEBHOOK");
      webhook != nullptr && *webhook != '\0') {
    config.security.alert_webhook_url = std::string(webhook);
  }
  if (const char *backend = std::getenv("TOOLWARDEN_OBSERVABILITY_BACKEND");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = backend;
  }
}

common::Status validate_webhook_url(const std::string &url) {
  const std::string lowered = common::to_lower(common::trim(url));
  std::string rest;
  if (common::starts_with(lowered, "https://")) {
    rest = lowered.substr(8);
  } else if (common::starts_with(lowered, "http://")) {
    rest = lowered.substr(7);
  } else {
    return common::Status::error("webhook URL must start with http:// or https://: " + url);
  }

  const auto host_end = rest.find_first_of("/?#");
  const std::string authority = rest.substr(0, host_end);
  std::string host = authority.substr(authority.rfind('@') == std::string::npos
                                          ? 0
                                          : authority.rfind('@') + 1);
  if (!host.empty() && host.front() != '[') {
    if (const auto colon = host.find(':'); colon != std::string::npos) {
      host = host.substr(0, colon);
    }
  }
  if (host.empty()) {
    return common::Status::error("webhook URL has no host: " + url);
  }
  for (const char ch : host) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      return common::Status::error("webhook URL host contains whitespace: " + url);
    }
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string mode = common::to_lower(common::trim(config.security.sanitization_mode));
  if (mode != "remove" && mode != "neutralize" && mode != "block") {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid security.sanitization_mode: " + config.security.sanitization_mode);
  }

  if (config.security.alert_webhook_url.has_value()) {
    const auto url_status = validate_webhook_url(*config.security.alert_webhook_url);
    if (!url_status.ok()) {
      return common::Result<std::vector<std::string>>::failure("security.alert_webhook_url: " +
                                                                url_status.error());
    }
    if (common::starts_with(common::to_lower(*config.security.alert_webhook_url), "http://")) {
      warnings.push_back("security.alert_webhook_url uses plain http; alerts travel unencrypted");
    }
  }

  if (config.security.pattern_time_budget_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "security.pattern_time_budget_ms must be > 0");
  }

  const auto &monitor = config.monitor;
  if (monitor.history_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure("monitor.history_capacity must be > 0");
  }
  if (monitor.alert_log_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "monitor.alert_log_capacity must be > 0");
  }
  if (monitor.window_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure("monitor.window_seconds must be > 0");
  }
  if (monitor.webhook_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "monitor.webhook_timeout_ms must be > 0");
  }
  if (monitor.webhook_queue_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "monitor.webhook_queue_capacity must be > 0");
  }
  if (monitor.min_history > monitor.history_capacity) {
    warnings.push_back("monitor.min_history exceeds monitor.history_capacity; anomaly rules never run");
  }

  if (!config.security.enabled) {
    warnings.push_back("security.enabled is false; tool calls pass through unscanned");
  } else if (!config.security.scan_tool_responses) {
    warnings.push_back("security.scan_tool_responses is false; tool output is not sanitized");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace toolwarden::config
