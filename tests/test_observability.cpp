#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"
#include "toolwarden/observability/factory.hpp"
#include "toolwarden/observability/global.hpp"
#include "toolwarden/observability/log_observer.hpp"
#include "toolwarden/observability/multi_observer.hpp"

#include <iostream>
#include <sstream>

namespace {

namespace obs = toolwarden::observability;
namespace tw = toolwarden::testing;

class StderrCapture {
public:
  StderrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~StderrCapture() { std::cerr.rdbuf(old_); }

  StderrCapture(const StderrCapture &) = delete;
  StderrCapture &operator=(const StderrCapture &) = delete;

  [[nodiscard]] std::string text() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *old_;
};

} // namespace

void register_observability_tests(std::vector<toolwarden::tests::TestCase> &tests) {
  using toolwarden::tests::require;

  tests.push_back({"observer_factory_backends", [] {
                     auto config = tw::quiet_config();
                     require(obs::create_observer(config)->name() == "noop", "none backend");
                     config.observability.backend = "LOG";
                     require(obs::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "";
                     require(obs::create_observer(config)->name() == "noop", "empty backend");
                     config.observability.backend = "log, none";
                     const auto multi = obs::create_observer(config);
                     require(multi->name() == "multi", "comma list");
                     require(dynamic_cast<obs::MultiObserver &>(*multi).size() == 2, "two sinks");
                   }});

  tests.push_back({"multi_observer_fans_out", [] {
                     obs::MultiObserver multi;
                     auto first = std::make_unique<tw::RecordingObserver>();
                     auto second = std::make_unique<tw::RecordingObserver>();
                     auto *first_raw = first.get();
                     auto *second_raw = second.get();
                     multi.add(std::move(first));
                     multi.add(std::move(second));
                     multi.add(nullptr);
                     require(multi.size() == 2, "null sink ignored");

                     multi.record_event(obs::WarningEvent{.component = "c", .message = "m"});
                     multi.record_metric(obs::AlertLogSizeMetric{.size = 1, .dropped = 0});
                     require(first_raw->events().size() == 1 && second_raw->events().size() == 1,
                             "events reach every sink");
                     require(first_raw->metric_count() == 1 && second_raw->metric_count() == 1,
                             "metrics reach every sink");
                   }});

  tests.push_back({"global_record_helpers", [] {
                     auto recorder = std::make_shared<tw::RecordingObserver>();
                     obs::set_global_observer(recorder);
                     obs::record_threat("tool.description", "TOOL_DESCRIPTION_POISON", "HIGH");
                     obs::record_tool_blocked("notes", "agent-1", "INSTRUCTION_OVERRIDE");
                     obs::record_security_alert("HIGH", "alert");
                     obs::record_delivery("https://hooks.example.com", false, "HTTP 502");
                     obs::record_error("gateway", "boom");
                     obs::set_global_observer(nullptr);
                     obs::record_warning("after", "reset");

                     const auto events = recorder->events();
                     require(events.size() == 5, "five events before reset");
                     const auto *threat = std::get_if<obs::ThreatDetectedEvent>(&events[0]);
                     require(threat != nullptr && threat->threat_type == "TOOL_DESCRIPTION_POISON",
                             "threat event");
                     const auto *blocked = std::get_if<obs::ToolBlockedEvent>(&events[1]);
                     require(blocked != nullptr && blocked->principal == "agent-1", "blocked event");
                     require(recorder->count_events<obs::DeliveryEvent>() == 1, "delivery event");
                     require(recorder->count_events<obs::ErrorEvent>() == 1, "error event");
                   }});

  tests.push_back({"log_observer_writes_levels", [] {
                     std::string text;
                     {
                       StderrCapture capture;
                       obs::LogObserver log;
                       log.record_event(obs::ToolBlockedEvent{
                           .tool = "notes", .principal = "agent-1", .reason = "PROMPT_LEAKAGE"});
                       log.record_event(obs::DeliveryEvent{
                           .target = "https://h.example.com", .delivered = false, .detail = "timed out"});
                       log.record_metric(obs::ScanLatencyMetric{
                           .scope = "response", .latency = std::chrono::microseconds(42)});
                       text = capture.text();
                     }
                     require(text.find("[ERROR] tool.blocked name=notes principal=agent-1") !=
                                 std::string::npos,
                             "blocked line");
                     require(text.find("alert.delivery_failed target=https://h.example.com: timed out") !=
                                 std::string::npos,
                             "delivery line");
                     require(text.find("[DEBUG] metric.scan_latency_us scope=response value=42") !=
                                 std::string::npos,
                             "metric line");
                   }});
}
