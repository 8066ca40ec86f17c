#pragma once

#include "drover/config/schema.hpp"
#include "drover/observability/observer.hpp"

#include <memory>

namespace drover::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace drover::observability
