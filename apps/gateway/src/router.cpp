#include "router.h"

#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>

namespace aegis::gateway {

PathPattern::PathPattern(kj::StringPtr pattern) : pattern_(kj::str(pattern)) {
  KJ_REQUIRE(pattern.startsWith("/"), "Pattern must start with '/'", pattern);

  kj::StringPtr remaining = pattern.slice(1);
  while (remaining.size() > 0) {
    kj::ArrayPtr<const char> segment_str = remaining.asArray();
    KJ_IF_SOME(slash_pos, remaining.findFirst('/')) {
      segment_str = remaining.slice(0, slash_pos);
      remaining = remaining.slice(slash_pos + 1);
    } else {
      remaining = ""_kj;
    }

    Segment segment;
    // Check if this is a parameter: {param_name}
    if (segment_str.size() >= 2 && segment_str[0] == '{' &&
        segment_str[segment_str.size() - 1] == '}') {
      KJ_REQUIRE(segment_str.size() > 2, "Parameter name cannot be empty", pattern);
      segment.is_param = true;
      segment.value = kj::str(segment_str.slice(1, segment_str.size() - 1));
    } else {
      segment.is_param = false;
      segment.value = kj::str(segment_str);
    }
    segments_.add(kj::mv(segment));
  }
}

bool PathPattern::match(kj::StringPtr path, kj::HashMap<kj::String, kj::String>& params) const {
  if (!path.startsWith("/")) {
    return false;
  }
  kj::StringPtr remaining = path.slice(1);

  size_t segment_index = 0;
  while (remaining.size() > 0) {
    if (segment_index >= segments_.size()) {
      return false;
    }
    kj::ArrayPtr<const char> path_segment = remaining.asArray();
    KJ_IF_SOME(slash_pos, remaining.findFirst('/')) {
      path_segment = remaining.slice(0, slash_pos);
      remaining = remaining.slice(slash_pos + 1);
    } else {
      remaining = ""_kj;
    }

    const auto& pattern_segment = segments_[segment_index++];
    if (pattern_segment.is_param) {
      if (path_segment.size() == 0) {
        return false;
      }
      params.upsert(kj::str(pattern_segment.value), kj::str(path_segment));
    } else if (path_segment != pattern_segment.value.asArray()) {
      return false;
    }
  }

  // Check if all pattern segments were matched
  return segment_index == segments_.size();
}

bool PathPattern::match(kj::StringPtr path) const {
  kj::HashMap<kj::String, kj::String> ignored;
  return match(path, ignored);
}

void Router::add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler) {
  KJ_REQUIRE(!pattern.endsWith("/"_kj) || pattern == "/"_kj,
             "Pattern must not end with '/' (except for root)");
  routes_.add(Route{method, PathPattern(pattern), kj::mv(handler)});
}

kj::Maybe<Router::RouteMatch> Router::match(kj::HttpMethod method, kj::StringPtr path) {
  kj::String normalized_path = normalize_path(path);

  for (auto& route : routes_) {
    if (route.method != method) {
      continue;
    }

    kj::HashMap<kj::String, kj::String> path_params;
    if (route.pattern.match(normalized_path, path_params)) {
      RouteMatch match;
      // kj::Function is not copyable; the route outlives the request
      match.handler = [&handler = route.handler](RequestContext& ctx) -> kj::Promise<void> {
        return handler(ctx);
      };
      match.path_params = kj::mv(path_params);
      return kj::mv(match);
    }
  }

  return kj::none;
}

bool Router::has_path(kj::StringPtr path) const {
  kj::String normalized_path = normalize_path(path);
  for (const auto& route : routes_) {
    if (route.pattern.match(normalized_path)) {
      return true;
    }
  }
  return false;
}

kj::Vector<kj::String> Router::get_methods_for_path(kj::StringPtr path) const {
  kj::Vector<kj::String> methods;
  kj::String normalized_path = normalize_path(path);

  for (const auto& route : routes_) {
    if (!route.pattern.match(normalized_path)) {
      continue;
    }
    auto name = get_method_name(route.method);
    bool found = false;
    for (const auto& existing_method : methods) {
      if (existing_method == name) {
        found = true;
        break;
      }
    }
    if (!found) {
      methods.add(kj::mv(name));
    }
  }

  return methods;
}

kj::String Router::normalize_path(kj::StringPtr path) {
  if (path.size() == 0) {
    return kj::str("/");
  }

  // Ensure path starts with /
  if (!path.startsWith("/")) {
    return normalize_path(kj::str("/", path));
  }

  // Remove trailing slash (except for root)
  if (path.size() > 1 && path.endsWith("/"_kj)) {
    return kj::str(path.slice(0, path.size() - 1));
  }

  return kj::str(path);
}

kj::String Router::get_method_name(kj::HttpMethod method) {
  return kj::str(method);
}

} // namespace aegis::gateway
