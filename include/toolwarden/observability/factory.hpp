#pragma once

#include "toolwarden/config/schema.hpp"
#include "toolwarden/observability/observer.hpp"

#include <memory>

namespace toolwarden::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace toolwarden::observability
