#include "toolwarden/observability/factory.hpp"

#include "toolwarden/common/strings.hpp"
#include "toolwarden/observability/log_observer.hpp"
#include "toolwarden/observability/multi_observer.hpp"
#include "toolwarden/observability/noop_observer.hpp"

#include <sstream>

namespace toolwarden::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend) {
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string p = common::trim(part);
    if (!p.empty()) {
      multi->add(create_single(p));
    }
  }
  return multi;
}

} // namespace toolwarden::observability
