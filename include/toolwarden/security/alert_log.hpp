#pragma once

#include "toolwarden/security/threat.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace toolwarden::security {

/// Fixed-capacity ring of alerts. When full, the oldest alert is overwritten.
class AlertLog {
public:
  explicit AlertLog(std::size_t capacity);

  void push(SecurityAlert alert);

  /// Newest first, at most `limit` entries. Does not consume.
  [[nodiscard]] std::vector<SecurityAlert> recent(std::size_t limit) const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return slots_.size(); }
  [[nodiscard]] std::uint64_t dropped() const;

private:
  mutable std::mutex mutex_;
  std::vector<SecurityAlert> slots_;
  std::size_t next_ = 0;
  std::size_t count_ = 0;
  std::uint64_t dropped_ = 0;
};

} // namespace toolwarden::security
