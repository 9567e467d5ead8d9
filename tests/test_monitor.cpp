#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolwarden/observability/global.hpp"
#include "toolwarden/security/alert_dispatcher.hpp"
#include "toolwarden/security/alert_log.hpp"
#include "toolwarden/security/behavior_monitor.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace {

namespace sec = toolwarden::security;
namespace tw = toolwarden::testing;
using Clock = std::chrono::system_clock;

std::unordered_map<std::string, std::string> params(const std::string &path) {
  return {{"path", path}};
}

std::string anomaly_of(const sec::SecurityAlert &alert) {
  return std::get<std::string>(alert.details.at("anomaly"));
}

sec::SecurityAlert named_alert(const std::string &message) {
  sec::SecurityAlert alert;
  alert.message = message;
  return alert;
}

} // namespace

void register_monitor_tests(std::vector<toolwarden::tests::TestCase> &tests) {
  using toolwarden::tests::require;

  tests.push_back({"monitor_repetition_after_baseline", [] {
                     sec::BehaviorMonitor monitor;
                     const auto now = Clock::now();
                     for (int i = 0; i < 10; ++i) {
                       const auto alert = monitor.track_at(now, "agent-1", "read_file",
                                                           params("/notes/" + std::to_string(i)),
                                                           "ok");
                       require(!alert.has_value(), "baseline raises nothing");
                     }
                     std::optional<sec::SecurityAlert> first;
                     int first_index = -1;
                     for (int i = 0; i < 11; ++i) {
                       auto alert =
                           monitor.track_at(now, "agent-1", "read_file", params("/etc/passwd"), "ok");
                       if (alert.has_value() && !first.has_value()) {
                         first = std::move(alert);
                         first_index = i;
                       }
                     }
                     require(first.has_value(), "repetition detected");
                     require(first_index == 10, "alert on the eleventh identical call");
                     require(anomaly_of(*first) == "repetition", "repetition rule");
                     require(first->severity == sec::Severity::High, "HIGH severity");
                     require(first->message == "Anomalous tool usage detected for agent agent-1",
                             "message names principal");
                     require(std::get<std::string>(first->details.at("tool_name")) == "read_file",
                             "tool in details");
                     require(std::get<std::int64_t>(first->details.at("response_size")) == 2,
                             "response size in details");
                     require(std::get<std::string>(first->details.at("params_hash")) ==
                                 sec::BehaviorMonitor::hash_params(params("/etc/passwd")),
                             "params hash in details");
                     require(monitor.get_recent_alerts().size() == 1, "alert logged once");
                   }});

  tests.push_back({"monitor_short_history_never_alerts", [] {
                     sec::BehaviorMonitor monitor;
                     const auto now = Clock::now();
                     for (int i = 0; i < 9; ++i) {
                       const auto alert =
                           monitor.track_at(now, "fresh", "tool_" + std::to_string(i), params("x"),
                                            std::string(500'000, 'r'));
                       require(!alert.has_value(), "no alert below minimum history");
                     }
                     require(monitor.get_recent_alerts().empty(), "alert log empty");
                     require(monitor.history_size("fresh") == 9, "history recorded");
                   }});

  tests.push_back({"monitor_frequency_rule", [] {
                     sec::BehaviorMonitor monitor;
                     const auto now = Clock::now();
                     std::optional<sec::SecurityAlert> alert;
                     int calls = 0;
                     while (!alert.has_value() && calls < 100) {
                       alert = monitor.track_at(now, "busy", "search",
                                                params(std::to_string(calls)), "r");
                       ++calls;
                     }
                     require(alert.has_value(), "frequency alert raised");
                     require(calls == 51, "fires once the window holds more than 50 calls");
                     require(anomaly_of(*alert) == "frequency", "frequency rule");
                   }});

  tests.push_back({"monitor_window_expires_old_calls", [] {
                     sec::BehaviorMonitor monitor;
                     const auto start = Clock::now();
                     for (int i = 0; i < 80; ++i) {
                       const auto alert =
                           monitor.track_at(start + std::chrono::seconds(2 * i), "steady", "search",
                                            params(std::to_string(i)), "r");
                       require(!alert.has_value(), "spaced calls stay under the window limit");
                     }
                   }});

  tests.push_back({"monitor_novel_tool_rule", [] {
                     sec::BehaviorMonitor monitor;
                     const auto now = Clock::now();
                     for (int i = 0; i < 11; ++i) {
                       require(!monitor.track_at(now, "agent", "search", params(std::to_string(i)), "r")
                                    .has_value(),
                               "baseline");
                     }
                     const auto alert = monitor.track_at(now, "agent", "delete_all", params("*"), "r");
                     require(alert.has_value(), "novel tool flagged");
                     require(anomaly_of(*alert) == "novel_tool", "novelty rule");
                     require(alert->tool_name == std::optional<std::string>("delete_all"),
                             "tool name on alert");
                   }});

  tests.push_back({"monitor_response_size_rule", [] {
                     sec::BehaviorMonitor monitor;
                     const auto now = Clock::now();
                     for (int i = 0; i < 9; ++i) {
                       (void)monitor.track_at(now, "agent", "fetch", params(std::to_string(i)), "r");
                     }
                     const auto alert = monitor.track_at(now, "agent", "fetch", params("big"),
                                                         std::string(100'001, 'x'));
                     require(alert.has_value(), "oversized response flagged");
                     require(anomaly_of(*alert) == "response_size", "size rule");
                     require(std::get<std::int64_t>(alert->details.at("response_size")) == 100'001,
                             "size reported");
                   }});

  tests.push_back({"monitor_principals_are_independent", [] {
                     sec::BehaviorMonitor monitor;
                     const auto now = Clock::now();
                     for (int i = 0; i < 30; ++i) {
                       (void)monitor.track_at(now, "a", "search", params(std::to_string(i)), "r");
                     }
                     const auto alert = monitor.track_at(now, "b", "rare_tool", params("x"),
                                                         std::string(200'000, 'x'));
                     require(!alert.has_value(), "other principal history does not count");
                     require(monitor.history_size("b") == 1, "separate history");
                   }});

  tests.push_back({"monitor_history_is_bounded", [] {
                     sec::MonitorThresholds thresholds;
                     thresholds.history_capacity = 5;
                     thresholds.min_history = 100;
                     sec::BehaviorMonitor monitor(thresholds);
                     for (int i = 0; i < 20; ++i) {
                       (void)monitor.track("agent", "search", params(std::to_string(i)), "r");
                     }
                     require(monitor.history_size("agent") == 5, "oldest records evicted");
                   }});

  tests.push_back({"monitor_concurrent_tracking_and_reads", [] {
                     sec::MonitorThresholds thresholds;
                     thresholds.history_capacity = 100;
                     thresholds.min_history = 1;
                     thresholds.max_response_size = 1;
                     thresholds.alert_log_capacity = 500;
                     sec::BehaviorMonitor monitor(thresholds);

                     constexpr std::size_t kWriters = 4;
                     constexpr std::size_t kCallsPerWriter = 100;
                     std::atomic<bool> writing{true};
                     std::atomic<std::size_t> largest_read{0};
                     std::atomic<int> missing_alerts{0};

                     const auto run_round = [&] {
                       writing = true;
                       std::vector<std::thread> readers;
                       for (int r = 0; r < 2; ++r) {
                         readers.emplace_back([&] {
                           while (writing.load()) {
                             const std::size_t seen = monitor.get_recent_alerts(1000).size();
                             std::size_t previous = largest_read.load();
                             while (seen > previous &&
                                    !largest_read.compare_exchange_weak(previous, seen)) {
                             }
                             std::this_thread::yield();
                           }
                         });
                       }
                       std::vector<std::thread> writers;
                       for (std::size_t w = 0; w < kWriters; ++w) {
                         writers.emplace_back([&, w] {
                           for (std::size_t i = 0; i < kCallsPerWriter; ++i) {
                             const std::string principal =
                                 i % 2 == 0 ? std::string("shared") : "agent-" + std::to_string(w);
                             if (!monitor.track(principal, "read_file", params("/tmp/x"), "xx")
                                      .has_value()) {
                               ++missing_alerts;
                             }
                           }
                         });
                       }
                       for (auto &writer : writers) {
                         writer.join();
                       }
                       writing = false;
                       for (auto &reader : readers) {
                         reader.join();
                       }
                     };

                     run_round();
                     require(missing_alerts.load() == 0, "every oversized response alerts");
                     require(monitor.alert_log().size() == kWriters * kCallsPerWriter,
                             "no alert lost below capacity");
                     require(monitor.get_recent_alerts(1000).size() == kWriters * kCallsPerWriter,
                             "all alerts readable");
                     require(monitor.history_size("shared") == 100, "shared history capped");
                     for (std::size_t w = 0; w < kWriters; ++w) {
                       require(monitor.history_size("agent-" + std::to_string(w)) == 50,
                               "per-writer history complete");
                     }

                     run_round();
                     require(largest_read.load() <= 500, "reads never exceed capacity");
                     require(monitor.alert_log().size() == 500, "log holds capacity");
                     require(monitor.alert_log().dropped() == 2 * kWriters * kCallsPerWriter - 500,
                             "overwritten alerts counted");
                     require(monitor.history_size("shared") == 100, "shared history still capped");
                     for (std::size_t w = 0; w < kWriters; ++w) {
                       require(monitor.history_size("agent-" + std::to_string(w)) == 100,
                               "per-writer history capped");
                     }
                   }});

  tests.push_back({"monitor_hash_params_ignores_key_order", [] {
                     std::unordered_map<std::string, std::string> first{{"a", "1"}, {"b", "two"}};
                     std::unordered_map<std::string, std::string> second{{"b", "two"}, {"a", "1"}};
                     require(sec::BehaviorMonitor::hash_params(first) ==
                                 sec::BehaviorMonitor::hash_params(second),
                             "stable hash");
                     require(sec::BehaviorMonitor::hash_params(first).size() == 64, "sha256 hex");
                     require(sec::BehaviorMonitor::hash_params(first) !=
                                 sec::BehaviorMonitor::hash_params({{"a", "2"}, {"b", "two"}}),
                             "values change the hash");
                   }});

  tests.push_back({"alert_log_is_a_ring", [] {
                     sec::AlertLog log(3);
                     for (int i = 0; i < 5; ++i) {
                       log.push(named_alert("a" + std::to_string(i)));
                     }
                     require(log.size() == 3, "bounded");
                     require(log.dropped() == 2, "drops counted");
                     const auto recent = log.recent(10);
                     require(recent.size() == 3, "only retained alerts");
                     require(recent[0].message == "a4" && recent[1].message == "a3" &&
                                 recent[2].message == "a2",
                             "newest first");
                     const auto two = log.recent(2);
                     require(two.size() == 2 && two[0].message == "a4", "limit honored");
                     require(log.recent(10).size() == 3, "reading does not consume");
                   }});

  tests.push_back({"monitor_webhook_validation", [] {
                     sec::BehaviorMonitor monitor;
                     require(!monitor.set_alert_webhook("ftp://hooks.example.com").ok(), "scheme");
                     require(!monitor.set_alert_webhook("https://").ok(), "missing host");
                     require(!monitor.alert_webhook().has_value(), "rejected URL not stored");
                     require(monitor.set_alert_webhook("  https://hooks.example.com/alerts ").ok(),
                             "valid URL");
                     require(monitor.alert_webhook() ==
                                 std::optional<std::string>("https://hooks.example.com/alerts"),
                             "trimmed URL stored");
                     monitor.clear_alert_webhook();
                     require(!monitor.alert_webhook().has_value(), "cleared");
                   }});

  tests.push_back({"monitor_forwards_alerts_to_webhook", [] {
                     auto client = std::make_shared<tw::FakeHttpClient>();
                     auto dispatcher = std::make_shared<sec::AlertDispatcher>(client);
                     sec::BehaviorMonitor monitor({}, dispatcher);
                     require(monitor.set_alert_webhook("https://hooks.example.com/a").ok(), "webhook");

                     monitor.raise_alert(named_alert("suspicious \"thing\""));
                     require(dispatcher->wait_idle(std::chrono::seconds(5)), "delivered");
                     const auto posts = client->posts();
                     require(posts.size() == 1, "one post");
                     require(posts[0].url == "https://hooks.example.com/a", "target URL");
                     require(posts[0].timeout_ms == 5000, "five second timeout");
                     require(posts[0].body.find("\"message\":\"suspicious \\\"thing\\\"\"") !=
                                 std::string::npos,
                             "alert JSON body");
                     require(monitor.get_recent_alerts().size() == 1, "alert also logged");
                     dispatcher->stop();
                   }});

  tests.push_back({"dispatcher_failure_is_logged_only", [] {
                     auto observer = std::make_shared<tw::RecordingObserver>();
                     toolwarden::observability::set_global_observer(observer);
                     auto client = std::make_shared<tw::FakeHttpClient>();
                     client->set_status(500);
                     sec::AlertDispatcher dispatcher(client);
                     dispatcher.enqueue("https://hooks.example.com/a", "{}");
                     require(dispatcher.wait_idle(std::chrono::seconds(5)), "attempted");
                     dispatcher.stop();
                     toolwarden::observability::set_global_observer(nullptr);

                     bool saw_failure = false;
                     for (const auto &event : observer->events()) {
                       if (const auto *delivery =
                               std::get_if<toolwarden::observability::DeliveryEvent>(&event)) {
                         saw_failure = !delivery->delivered && delivery->detail == "HTTP 500";
                       }
                     }
                     require(saw_failure, "failed delivery recorded");
                     require(client->posts().size() == 1, "no retry");
                   }});

  tests.push_back({"dispatcher_drops_oldest_when_full", [] {
                     auto client = std::make_shared<tw::FakeHttpClient>();
                     client->set_delay(std::chrono::milliseconds(100));
                     sec::AlertDispatcher dispatcher(
                         client, sec::AlertDispatcherOptions{.timeout_ms = 1000, .queue_capacity = 2});
                     for (int i = 0; i < 6; ++i) {
                       dispatcher.enqueue("https://hooks.example.com/a", std::to_string(i));
                     }
                     require(dispatcher.wait_idle(std::chrono::seconds(10)), "drained");
                     const auto posts = client->posts();
                     require(dispatcher.dropped() >= 3, "overflow dropped");
                     require(posts.size() + dispatcher.dropped() == 6, "every alert accounted for");
                     require(posts.back().body == "5", "newest alert kept");
                     dispatcher.stop();
                   }});

  tests.push_back({"dispatcher_enqueue_returns_immediately", [] {
                     auto client = std::make_shared<tw::FakeHttpClient>();
                     client->set_delay(std::chrono::milliseconds(300));
                     sec::AlertDispatcher dispatcher(client);
                     const auto started = std::chrono::steady_clock::now();
                     dispatcher.enqueue("https://hooks.example.com/a", "{}");
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(elapsed < std::chrono::milliseconds(200), "caller does not wait");
                     require(dispatcher.is_running(), "worker started lazily");
                     dispatcher.stop();
                     require(!dispatcher.is_running(), "stopped");
                   }});
}
