#include "toolwarden/security/alert_dispatcher.hpp"

#include "toolwarden/observability/global.hpp"

#include <algorithm>
#include <exception>

namespace toolwarden::security {

AlertDispatcher::AlertDispatcher(std::shared_ptr<http::HttpClient> client,
                                 AlertDispatcherOptions options)
    : client_(std::move(client)), options_(options) {
  options_.queue_capacity = std::max<std::size_t>(1, options_.queue_capacity);
}

AlertDispatcher::~AlertDispatcher() { stop(); }

void AlertDispatcher::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void AlertDispatcher::stop() {
  std::size_t discarded = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ && !thread_.joinable()) {
      return;
    }
    running_ = false;
    discarded = queue_.size();
    queue_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  idle_cv_.notify_all();
  if (discarded > 0) {
    observability::record_warning("alerts", "discarded " + std::to_string(discarded) +
                                                " pending webhook post(s) on shutdown");
  }
}

bool AlertDispatcher::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void AlertDispatcher::enqueue(std::string url, std::string body) {
  if (client_ == nullptr) {
    observability::record_delivery(url, false, "no HTTP client configured");
    return;
  }
  start();
  bool overflowed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= options_.queue_capacity) {
      queue_.pop_front();
      ++dropped_;
      overflowed = true;
    }
    queue_.push_back(PendingPost{.url = std::move(url), .body = std::move(body)});
  }
  cv_.notify_one();
  if (overflowed) {
    observability::record_warning("alerts", "webhook queue full; dropped oldest pending alert");
  }
}

bool AlertDispatcher::wait_idle(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return queue_.empty() && !in_flight_; });
}

std::size_t AlertDispatcher::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

std::uint64_t AlertDispatcher::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

void AlertDispatcher::run_loop() {
  while (true) {
    PendingPost post;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      if (!running_) {
        return;
      }
      post = std::move(queue_.front());
      queue_.pop_front();
      in_flight_ = true;
    }

    deliver(post);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = false;
    }
    idle_cv_.notify_all();
  }
}

void AlertDispatcher::deliver(const PendingPost &post) {
  try {
    const auto response = client_->post_json(post.url, {}, post.body, options_.timeout_ms);
    if (response.ok()) {
      observability::record_delivery(post.url, true);
      return;
    }
    std::string detail;
    if (response.timeout) {
      detail = "timed out";
    } else if (response.network_error) {
      detail = response.network_error_message;
    } else {
      detail = "HTTP " + std::to_string(response.status);
    }
    observability::record_delivery(post.url, false, detail);
  } catch (const std::exception &e) {
    observability::record_delivery(post.url, false, e.what());
  }
}

} // namespace toolwarden::security
