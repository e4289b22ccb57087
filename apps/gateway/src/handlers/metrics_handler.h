#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/string.h>

// Forward declaration
namespace aegis::core {
class MetricsRegistry;
}

namespace aegis::gateway {

/**
 * Prometheus metrics handler.
 *
 * Handles endpoint:
 * - GET /metrics - Prometheus metrics exposition
 */
class MetricsHandler {
public:
  explicit MetricsHandler(core::MetricsRegistry& registry);

  /**
   * Handle GET /metrics
   *
   * Returns Prometheus format metrics text.
   * Format:
   * # HELP metric_name Description
   * # TYPE metric_name counter|gauge|histogram
   * metric_name{label="value"} value
   * metric_name_bucket{le="0.005"} count
   * ...
   */
  kj::Promise<void> handleMetrics(RequestContext& ctx);

private:
  core::MetricsRegistry& registry_;
};

} // namespace aegis::gateway
