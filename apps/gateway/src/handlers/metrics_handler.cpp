#include "handlers/metrics_handler.h"

#include "aegis/core/metrics.h"

#include <kj/compat/http.h>
#include <kj/debug.h>

namespace aegis::gateway {

MetricsHandler::MetricsHandler(core::MetricsRegistry& registry) : registry_(registry) {}

kj::Promise<void> MetricsHandler::handleMetrics(RequestContext& ctx) {
  kj::String body;
  uint32_t status = 200;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() { body = registry_.to_prometheus(); })) {
    KJ_LOG(ERROR, "Error in metrics handler", exception);
    // Plain text error, the scraper expects text
    body = kj::str("# ERROR: ", exception.getDescription());
    status = 500;
  }

  kj::HttpHeaders response_headers(ctx.headerTable);
  response_headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE,
                          "text/plain; version=0.0.4; charset=utf-8"_kj);

  auto stream = ctx.response.send(status, util::statusText(status), response_headers, body.size());
  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

} // namespace aegis::gateway
