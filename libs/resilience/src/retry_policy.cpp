#include "aegis/resilience/retry_policy.h"

#include <algorithm>

namespace aegis::resilience {

int64_t RetryPolicy::delay_ms(uint32_t attempt) const {
  if (base_delay_ms <= 0) {
    return 0;
  }
  int64_t delay = base_delay_ms;
  for (uint32_t i = 0; i < attempt; ++i) {
    if (delay >= max_delay_ms) {
      break;
    }
    delay *= 2;
  }
  return std::min(delay, max_delay_ms);
}

bool is_retryable_error(core::ErrorCode code) noexcept {
  switch (code) {
  case core::ErrorCode::NetworkError:
  case core::ErrorCode::ServiceUnavailable:
  case core::ErrorCode::Timeout:
  case core::ErrorCode::BadGateway:
    return true;
  default:
    return false;
  }
}

} // namespace aegis::resilience
