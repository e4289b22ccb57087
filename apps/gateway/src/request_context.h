#pragma once

#include "aegis/core/error.h"
#include "auth/identity.h"
#include "util/http_utils.h"

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway {

/**
 * Per-request context containing request data, caller identity,
 * and response helpers.
 *
 * Populated by the GatewayServer and passed to handlers.
 */
struct RequestContext {
  // Request data
  kj::HttpMethod method;
  kj::StringPtr path;
  kj::StringPtr queryString;
  const kj::HttpHeaders& headers; // const reference - handlers shouldn't modify
  kj::AsyncInputStream& body;     // reference - lifetime managed by GatewayServer

  // Response object (for sending responses)
  kj::HttpService::Response& response;

  // Header table reference (needed for creating response headers)
  const kj::HttpHeaderTable& headerTable;

  // Extracted path parameters (e.g., {key} from /admin/breakers/{key}/reset)
  kj::HashMap<kj::String, kj::String> path_params;

  // Anonymous unless a valid bearer token was presented
  auth::Identity identity;

  // Client info
  kj::String clientIP;

  // Response helpers
  kj::Promise<void> sendJson(uint32_t status, kj::String body);
  kj::Promise<void> sendError(core::ErrorCode code, kj::StringPtr message);

  // Utilities
  kj::Promise<kj::String> readBodyAsString();
  kj::Maybe<kj::StringPtr> getHeader(kj::StringPtr name) const;
  kj::Maybe<kj::StringPtr> pathParam(kj::StringPtr name) const;
};

// Inline implementations for RequestContext methods

inline kj::Promise<void> RequestContext::sendJson(uint32_t status, kj::String body) {
  kj::HttpHeaders responseHeaders(headerTable);
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json"_kj);

  auto stream = response.send(status, util::statusText(status), responseHeaders, body.size());
  auto promise = stream->write(body.asBytes());
  return promise.attach(kj::mv(stream), kj::mv(body));
}

inline kj::Promise<void> RequestContext::sendError(core::ErrorCode code, kj::StringPtr message) {
  return sendJson(static_cast<uint32_t>(core::to_http_status(code)), core::error_body(code, message));
}

inline kj::Promise<kj::String> RequestContext::readBodyAsString() {
  return body.readAllText();
}

inline kj::Maybe<kj::StringPtr> RequestContext::getHeader(kj::StringPtr name) const {
  return util::getHeader(headers, name);
}

inline kj::Maybe<kj::StringPtr> RequestContext::pathParam(kj::StringPtr name) const {
  KJ_IF_SOME(value, path_params.find(name)) {
    return kj::StringPtr(value);
  }
  return kj::none;
}

} // namespace aegis::gateway
