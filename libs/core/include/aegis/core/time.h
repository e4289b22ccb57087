#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/string.h>

namespace aegis::core {

[[nodiscard]] std::int64_t now_unix_ms();
[[nodiscard]] std::int64_t now_steady_ms();
[[nodiscard]] kj::String now_utc_iso8601();

/**
 * @brief Millisecond clock injected into time-dependent components
 *
 * Production code uses steady_millis_clock(); tests pass a lambda reading a
 * manually advanced counter.
 */
using MillisClock = kj::Function<std::int64_t()>;

[[nodiscard]] MillisClock steady_millis_clock();

} // namespace aegis::core
