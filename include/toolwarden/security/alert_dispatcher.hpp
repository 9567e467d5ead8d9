#pragma once

#include "toolwarden/http/client.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace toolwarden::security {

struct AlertDispatcherOptions {
  std::uint64_t timeout_ms = 5000;
  std::size_t queue_capacity = 256;
};

/// Posts alert JSON to webhooks from a background thread. Delivery is best-effort and
/// at-most-once: no retries, and when the queue is full the oldest pending post is dropped.
class AlertDispatcher {
public:
  AlertDispatcher(std::shared_ptr<http::HttpClient> client, AlertDispatcherOptions options = {});
  ~AlertDispatcher();

  AlertDispatcher(const AlertDispatcher &) = delete;
  AlertDispatcher &operator=(const AlertDispatcher &) = delete;

  void start();
  /// Pending posts that have not started are discarded.
  void stop();
  [[nodiscard]] bool is_running() const;

  /// Starts the worker on first use.
  void enqueue(std::string url, std::string body);

  /// Waits until the queue is empty and no post is in flight.
  bool wait_idle(std::chrono::milliseconds timeout);

  [[nodiscard]] std::size_t pending() const;
  [[nodiscard]] std::uint64_t dropped() const;

private:
  struct PendingPost {
    std::string url;
    std::string body;
  };

  void run_loop();
  void deliver(const PendingPost &post);

  std::shared_ptr<http::HttpClient> client_;
  AlertDispatcherOptions options_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<PendingPost> queue_;
  bool running_ = false;
  bool in_flight_ = false;
  std::uint64_t dropped_ = 0;
  std::thread thread_;
};

} // namespace toolwarden::security
