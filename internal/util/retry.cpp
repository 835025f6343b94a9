#include "retry.hpp"

#include <cmath>

namespace rollout::util {

Millis BackoffFor(const RetryPolicy& policy, uint32_t attempt) {
  if (attempt <= 1) {
    return Millis{0};
  }

  const double multiplier = policy.multiplier < 1.0 ? 1.0 : policy.multiplier;
  const double scaled     = static_cast<double>(policy.initial_backoff.count()) * std::pow(multiplier, static_cast<double>(attempt - 2));
  const auto   capped     = std::min(scaled, static_cast<double>(policy.max_backoff.count()));
  return Millis{static_cast<Millis::rep>(capped)};
}

} // namespace rollout::util
