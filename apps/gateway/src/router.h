#pragma once

#include "request_context.h"

#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway {

/**
 * Path pattern with `{name}` placeholders, e.g. `/admin/breakers/{key}/reset`.
 *
 * A placeholder matches exactly one non-empty path segment.
 */
class PathPattern {
public:
  /**
   * @throws kj::Exception if the pattern does not start with '/' or has an empty placeholder
   */
  explicit PathPattern(kj::StringPtr pattern);

  PathPattern(PathPattern&&) = default;
  PathPattern& operator=(PathPattern&&) = default;

  /**
   * Matches a normalized path, extracting placeholder values into params.
   */
  bool match(kj::StringPtr path, kj::HashMap<kj::String, kj::String>& params) const;
  bool match(kj::StringPtr path) const;

  kj::StringPtr text() const {
    return pattern_;
  }

private:
  struct Segment {
    kj::String value; // Either a literal segment or parameter name
    bool is_param;    // True if this segment is a parameter (e.g., {id})
  };

  kj::String pattern_;
  kj::Vector<Segment> segments_;
};

/**
 * HTTP request router for the gateway's own endpoints.
 *
 * Features:
 * - HTTP method-based routing
 * - Path pattern matching with parameters (e.g., `/admin/breakers/{key}/reset`)
 * - 404 (Not Found) and 405 (Method Not Allowed) support through has_path and
 *   get_methods_for_path
 *
 * Proxied traffic does not go through the Router; it is resolved by the
 * RouteTable instead.
 */
class Router {
public:
  /**
   * Handler function type for processing HTTP requests.
   * Returns a promise that completes when the response is sent.
   */
  using Handler = kj::Function<kj::Promise<void>(RequestContext&)>;

  /**
   * RouteMatch represents the result of a route lookup.
   * Contains the handler and any extracted path parameters.
   */
  struct RouteMatch {
    mutable Handler handler;
    kj::HashMap<kj::String, kj::String> path_params;
  };

  /**
   * Adds a route to the router.
   *
   * @param method The HTTP method to match (GET, POST, PUT, DELETE, etc.)
   * @param pattern The URL pattern, optionally containing parameters in braces
   * @param handler The handler function to call when the route matches
   *
   * @throws kj::Exception if the pattern is invalid
   */
  void add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler);

  /**
   * Matches a request against registered routes.
   *
   * @return A RouteMatch if a matching route is found, or none
   */
  kj::Maybe<RouteMatch> match(kj::HttpMethod method, kj::StringPtr path);

  /**
   * Checks if any route exists for the given path with any HTTP method.
   */
  bool has_path(kj::StringPtr path) const;

  /**
   * Gets all HTTP methods registered for a given path, for the Allow header.
   */
  kj::Vector<kj::String> get_methods_for_path(kj::StringPtr path) const;

  size_t route_count() const {
    return routes_.size();
  }

  static kj::String get_method_name(kj::HttpMethod method);

  /**
   * Ensures a leading '/' and drops a trailing one (except for root).
   */
  static kj::String normalize_path(kj::StringPtr path);

private:
  struct Route {
    kj::HttpMethod method;
    PathPattern pattern;
    Handler handler;
  };

  kj::Vector<Route> routes_;
};

} // namespace aegis::gateway
