#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/string.h>

namespace aegis::gateway {

namespace realtime {
class FanoutGateway;
}

/**
 * Internal event ingestion for the realtime fan-out.
 *
 * Handles endpoints (X-Admin-Token required):
 * - POST /internal/events - {"channel": "...", "event": "...", "payload": <any>}
 * - POST /internal/notify - {"identity": "<subject>", "event": "...", "payload": <any>}
 *
 * Both answer {"delivered": <connections reached>}.
 */
class EventsHandler {
public:
  EventsHandler(kj::StringPtr admin_token, realtime::FanoutGateway& fanout);

  kj::Promise<void> handlePublish(RequestContext& ctx);
  kj::Promise<void> handleNotify(RequestContext& ctx);

private:
  kj::String admin_token_;
  realtime::FanoutGateway& fanout_;
};

} // namespace aegis::gateway
