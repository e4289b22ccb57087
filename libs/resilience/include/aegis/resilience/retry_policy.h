#pragma once

#include "aegis/core/error.h"

#include <cstdint>
#include <kj/common.h>

namespace aegis::resilience {

/**
 * @brief Exponential backoff policy for the proxy's retry loop
 *
 * delay(attempt) = min(max_delay, base_delay * 2^attempt), attempt counted
 * from 0 for the first retry. No jitter: retries are already spread across
 * instances by the registry's random pick.
 */
struct RetryPolicy {
  uint32_t max_retries{2};
  int64_t base_delay_ms{1000};
  int64_t max_delay_ms{30000};

  [[nodiscard]] int64_t delay_ms(uint32_t attempt) const;

  // True when another attempt is allowed after `attempts_made` attempts
  [[nodiscard]] bool allows_another(uint32_t attempts_made) const noexcept {
    return attempts_made <= max_retries;
  }
};

/**
 * @brief 5xx statuses are retryable; everything else is final
 */
[[nodiscard]] inline bool is_retryable_status(uint32_t status) noexcept {
  return status >= 500 && status <= 599;
}

/**
 * @brief Transport and deadline failures worth another attempt
 */
[[nodiscard]] bool is_retryable_error(core::ErrorCode code) noexcept;

} // namespace aegis::resilience
