#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/cancel_token.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace rollout::util {

// Bounded exponential backoff for transient infrastructure errors.
struct RetryPolicy {
  uint32_t max_attempts = 4;
  Millis   initial_backoff{100};
  Millis   max_backoff{2000};
  double   multiplier = 2.0;
};

// Backoff before attempt `attempt` (1-based; attempt 1 is never delayed).
Millis BackoffFor(const RetryPolicy& policy, uint32_t attempt);

/*
  Runs `fn`, retrying only on util::Unavailable. Any other exception propagates
  immediately. When attempts are exhausted the last Unavailable is rethrown with
  the attempt count appended. A cancelled token stops the retry loop early.
*/
template <typename Fn>
auto RetryTransient(const RetryPolicy& policy, std::string_view operation, Fn&& fn, const CancelToken* cancel = nullptr) {
  const uint32_t attempts = std::max<uint32_t>(policy.max_attempts, 1);
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const Unavailable& e) {
      if (attempt >= attempts) {
        throw Unavailable(std::string(operation) + " failed after " + std::to_string(attempt) + " attempts: " + e.what());
      }

      const auto delay = BackoffFor(policy, attempt + 1);
      ROLLOUT_LOG_WARN("transient failure, retrying",
                       {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                        observability::IntField("backoff_ms", delay.count()), observability::StringField("error", e.what())});

      if (cancel != nullptr) {
        if (cancel->WaitFor(delay)) {
          throw Unavailable(std::string(operation) + " cancelled during retry: " + e.what());
        }
      } else {
        CancelToken never;
        never.WaitFor(delay);
      }
    }
  }
}

} // namespace rollout::util
