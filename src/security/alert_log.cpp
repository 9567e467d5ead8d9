#include "toolwarden/security/alert_log.hpp"

#include <algorithm>

namespace toolwarden::security {

AlertLog::AlertLog(const std::size_t capacity) : slots_(std::max<std::size_t>(1, capacity)) {}

void AlertLog::push(SecurityAlert alert) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count_ == slots_.size()) {
    ++dropped_;
  } else {
    ++count_;
  }
  slots_[next_] = std::move(alert);
  next_ = (next_ + 1) % slots_.size();
}

std::vector<SecurityAlert> AlertLog::recent(const std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t take = std::min(limit, count_);
  std::vector<SecurityAlert> out;
  out.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    const std::size_t index = (next_ + slots_.size() - 1 - i) % slots_.size();
    out.push_back(slots_[index]);
  }
  return out;
}

std::size_t AlertLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

std::uint64_t AlertLog::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace toolwarden::security
