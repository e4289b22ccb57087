#pragma once

#include "aegis/core/json.h"
#include "router.h"

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway {

/**
 * @brief Declared route of a backend service
 *
 * `idempotent` is the explicit retry declaration. When absent, the request
 * method decides: GET and HEAD are idempotent, everything else is not.
 */
struct RouteRule {
  kj::Maybe<kj::HttpMethod> method; // none matches any method
  PathPattern pattern;
  kj::Maybe<bool> idempotent;
};

/**
 * @brief What the proxy needs to forward one request
 */
struct ResolvedRoute {
  kj::StringPtr service;
  // Breaker key component: the matched rule's pattern, or the service prefix
  kj::StringPtr route_template;
  bool idempotent{false};
};

/**
 * @brief Version-less path -> backend service mapping
 *
 * Built once at startup and read-only afterwards. A request belongs to the
 * service with the longest path_prefix that matches on a segment boundary;
 * within that service the first declared rule matching method and path
 * supplies the route template and idempotency.
 */
class RouteTable {
public:
  RouteTable() = default;
  RouteTable(const RouteTable&) = delete;
  RouteTable& operator=(const RouteTable&) = delete;

  /**
   * @brief Build from the catalog's services[].{name, path_prefix, routes}
   *
   * path_prefix defaults to "/<name>".
   * @throws ValidationException on a missing name, a bad prefix or an unknown method
   */
  static kj::Own<RouteTable> from_catalog(const core::JsonValue& root);

  void add_service(kj::StringPtr service, kj::StringPtr path_prefix);

  /**
   * @throws ValidationException if the service was not added first
   */
  void add_rule(kj::StringPtr service, kj::Maybe<kj::HttpMethod> method, kj::StringPtr pattern,
                kj::Maybe<bool> idempotent = kj::none);

  // `path` has the version prefix already stripped and no query string
  [[nodiscard]] kj::Maybe<ResolvedRoute> resolve(kj::HttpMethod method, kj::StringPtr path) const;

  [[nodiscard]] size_t service_count() const {
    return services_.size();
  }

  [[nodiscard]] static bool default_idempotent(kj::HttpMethod method);

private:
  struct ServiceRoutes {
    kj::String service;
    kj::String path_prefix;
    kj::Vector<RouteRule> rules;
  };

  [[nodiscard]] static bool prefix_matches(kj::StringPtr prefix, kj::StringPtr path);

  kj::Vector<ServiceRoutes> services_;
};

} // namespace aegis::gateway
