#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolwarden/config/config.hpp"

#include <algorithm>

void register_config_tests(std::vector<toolwarden::tests::TestCase> &tests) {
  using toolwarden::tests::require;
  namespace cfg = toolwarden::config;
  namespace tw = toolwarden::testing;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.security.enabled, "enabled by default");
                     require(config.security.scan_tool_schemas, "schema scan on");
                     require(config.security.scan_tool_responses, "response scan on");
                     require(config.security.sanitization_mode == "remove", "remove mode");
                     require(!config.security.alert_webhook_url.has_value(), "no webhook");
                     require(!config.security.fail_closed, "fail open");
                     require(config.monitor.min_history == 10, "min history");
                     require(config.monitor.max_calls_per_window == 50, "frequency limit");
                     require(config.monitor.webhook_timeout_ms == 5000, "webhook timeout");
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok() && validated.value().empty(), "defaults validate cleanly");
                   }});

  tests.push_back({"config_parse_sections", [] {
                     const std::string toml = R"(
[security]
enabled = true
sanitization_mode = "neutralize"
alert_webhook_url = "https://hooks.example.com/alerts"
fail_closed = true
hide_unsafe_tools = true
pattern_time_budget_ms = 100

[monitor]
min_history = 5
max_identical_calls = 3
window_seconds = 30

[observability]
backend = "none"
)";
                     const auto parsed = cfg::parse_config(toml);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.security.sanitization_mode == "neutralize", "mode");
                     require(config.security.alert_webhook_url ==
                                 std::optional<std::string>("https://hooks.example.com/alerts"),
                             "webhook");
                     require(config.security.fail_closed, "fail closed");
                     require(config.security.hide_unsafe_tools, "hide unsafe");
                     require(config.security.pattern_time_budget_ms == 100, "budget");
                     require(config.monitor.min_history == 5, "min history");
                     require(config.monitor.max_identical_calls == 3, "identical calls");
                     require(config.monitor.window_seconds == 30, "window");
                     require(config.monitor.history_capacity == 1000, "untouched default");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_unknown_keys_are_warnings", [] {
                     std::vector<std::string> warnings;
                     const auto parsed = cfg::parse_config(
                         "[security]\nsanitisation_mode = \"block\"\n[monitor]\nmin_histroy = 2\n",
                         &warnings);
                     require(parsed.ok(), "unknown keys do not fail parsing");
                     require(parsed.value().security.sanitization_mode == "remove",
                             "misspelled key ignored");
                     require(warnings.size() == 2, "two warnings");
                     require(std::find(warnings.begin(), warnings.end(),
                                       "unknown config key: security.sanitisation_mode") !=
                                 warnings.end(),
                             "security typo reported");
                   }});

  tests.push_back({"config_parse_rejects_malformed_toml", [] {
                     require(!cfg::parse_config("[security\nenabled = true\n").ok(),
                             "unterminated section rejected");
                     require(!cfg::parse_config("[]\n").ok(), "empty section rejected");
                     require(!cfg::parse_config("[security]\njust words\n").ok(),
                             "line without '=' rejected");
                   }});

  tests.push_back({"config_validation_failures", [] {
                     cfg::Config config;
                     config.security.sanitization_mode = "scrub";
                     require(!cfg::validate_config(config).ok(), "bad mode");

                     config = cfg::Config{};
                     config.security.alert_webhook_url = "hooks.example.com";
                     const auto bad_url = cfg::validate_config(config);
                     require(!bad_url.ok(), "schemeless webhook");
                     require(bad_url.error().find("security.alert_webhook_url") != std::string::npos,
                             "error names the key");

                     config = cfg::Config{};
                     config.monitor.alert_log_capacity = 0;
                     require(!cfg::validate_config(config).ok(), "zero alert log");

                     config = cfg::Config{};
                     config.security.pattern_time_budget_ms = 0;
                     require(!cfg::validate_config(config).ok(), "zero budget");
                   }});

  tests.push_back({"config_validation_warnings", [] {
                     cfg::Config config;
                     config.security.alert_webhook_url = "http://hooks.internal/alerts";
                     config.security.enabled = false;
                     config.monitor.min_history = 2000;
                     const auto validated = cfg::validate_config(config);
                     require(validated.ok(), "warnings are not failures");
                     require(validated.value().size() == 3, "three warnings");
                   }});

  tests.push_back({"config_webhook_url_rules", [] {
                     require(cfg::validate_webhook_url("https://hooks.example.com").ok(), "https");
                     require(cfg::validate_webhook_url("HTTP://user@host:8080/path").ok(),
                             "userinfo and port");
                     require(!cfg::validate_webhook_url("https:///path").ok(), "empty host");
                     require(!cfg::validate_webhook_url("file:///etc/passwd").ok(), "file scheme");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     tw::EnvGuard enabled("TOOLWARDEN_SECURITY_ENABLED", std::string("off"));
                     tw::EnvGuard mode("TOOLWARDEN_SECURITY_SANITIZATION_MODE", std::string("block"));
                     tw::EnvGuard webhook("TOOLWARDEN_SECURITY_ALERT_WEBHOOK",
                                          std::string("https://env.example.com/hook"));
                     tw::EnvGuard responses("TOOLWARDEN_SECURITY_SCAN_TOOL_RESPONSES",
                                            std::string("maybe"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(!config.security.enabled, "enabled overridden");
                     require(config.security.sanitization_mode == "block", "mode overridden");
                     require(config.security.alert_webhook_url ==
                                 std::optional<std::string>("https://env.example.com/hook"),
                             "webhook overridden");
                     require(config.security.scan_tool_responses, "unparseable bool ignored");
                   }});

  tests.push_back({"config_load_from_override_path", [] {
                     tw::TempDir dir;
                     tw::EnvGuard mode("TOOLWARDEN_SECURITY_SANITIZATION_MODE", std::nullopt);
                     const auto path =
                         dir.write_file("config.toml", "[security]\nsanitization_mode = \"block\"\n");
                     cfg::set_config_path_override(path);
                     const auto resolved = cfg::config_path();
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();

                     require(resolved.ok() && resolved.value() == path, "override wins");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().security.sanitization_mode == "block", "file applied");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     tw::TempDir dir;
                     tw::EnvGuard path_env("TOOLWARDEN_CONFIG_PATH",
                                           (dir.path() / "absent.toml").string());
                     tw::EnvGuard enabled("TOOLWARDEN_SECURITY_ENABLED", std::nullopt);
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), "missing file is not an error");
                     require(loaded.value().security.enabled, "defaults");
                     require(!cfg::load_config_file(dir.path() / "absent.toml").ok(),
                             "explicit file must exist");
                   }});
}
