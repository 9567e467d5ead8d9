#pragma once

#include "toolwarden/config/schema.hpp"
#include "toolwarden/http/client.hpp"
#include "toolwarden/observability/observer.hpp"
#include "toolwarden/security/threat_scanner.hpp"
#include "toolwarden/tools/tool.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolwarden::testing {

/// Defaults with logging switched off.
config::Config quiet_config();

struct RecordedPost {
  std::string url;
  std::string body;
  std::uint64_t timeout_ms = 0;
};

class FakeHttpClient final : public http::HttpClient {
public:
  [[nodiscard]] http::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

  void set_status(std::uint16_t status);
  void set_network_error(std::string message);
  void set_delay(std::chrono::milliseconds delay);

  [[nodiscard]] std::vector<RecordedPost> posts() const;

private:
  mutable std::mutex mutex_;
  std::vector<RecordedPost> posts_;
  std::uint16_t status_ = 200;
  std::optional<std::string> network_error_;
  std::chrono::milliseconds delay_{0};
};

/// Tool whose behavior is scripted by the test.
class FakeTool final : public tools::ITool {
public:
  enum class Mode { Respond, Fail, Throw, ReportFailure };

  FakeTool(std::string name, std::string response, std::string description = "Test tool",
           std::string parameters = "{}");

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return description_; }
  [[nodiscard]] std::string parameters_schema() const override { return parameters_; }
  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;

  void set_mode(Mode mode) { mode_ = mode; }
  void set_units(std::vector<tools::ContentUnit> units) { units_ = std::move(units); }

  /// Shared so tests can observe calls after the registry takes ownership.
  struct Calls {
    std::atomic<int> count{0};
    std::mutex mutex;
    std::string last_principal;
  };
  [[nodiscard]] std::shared_ptr<Calls> calls() const { return calls_; }

private:
  std::string name_;
  std::string response_;
  std::string description_;
  std::string parameters_;
  Mode mode_ = Mode::Respond;
  std::vector<tools::ContentUnit> units_;
  std::shared_ptr<Calls> calls_ = std::make_shared<Calls>();
};

class FakeClassifier final : public security::IMlClassifier {
public:
  FakeClassifier(bool enabled, common::Result<security::MlVerdict> verdict)
      : enabled_(enabled), verdict_(std::move(verdict)) {}

  [[nodiscard]] bool enabled() const override { return enabled_; }
  [[nodiscard]] common::Result<security::MlVerdict> classify(const std::string &) override {
    ++calls;
    return verdict_;
  }

  std::atomic<int> calls{0};

private:
  bool enabled_;
  common::Result<security::MlVerdict> verdict_;
};

/// Captures every event and metric in order.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::size_t metric_count() const;

  template <typename T> [[nodiscard]] std::size_t count_events() const {
    std::size_t count = 0;
    for (const auto &event : events()) {
      if (std::holds_alternative<T>(event)) {
        ++count;
      }
    }
    return count;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::size_t metrics_ = 0;
};

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::filesystem::path write_file(const std::string &name,
                                                 const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  std::string key;
  std::optional<std::string> old_value;
};

} // namespace toolwarden::testing
