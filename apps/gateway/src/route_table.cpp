#include "route_table.h"

#include "aegis/core/error.h"

#include <kj/debug.h>

namespace aegis::gateway {

bool RouteTable::default_idempotent(kj::HttpMethod method) {
  return method == kj::HttpMethod::GET || method == kj::HttpMethod::HEAD;
}

bool RouteTable::prefix_matches(kj::StringPtr prefix, kj::StringPtr path) {
  if (prefix == "/"_kj) {
    return true;
  }
  if (!path.startsWith(prefix)) {
    return false;
  }
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

void RouteTable::add_service(kj::StringPtr service, kj::StringPtr path_prefix) {
  if (service.size() == 0) {
    throw core::ValidationException("route table entry needs a service name"_kj);
  }
  if (!path_prefix.startsWith("/")) {
    throw core::ValidationException(
        kj::str("path prefix of service '", service, "' must start with '/'"));
  }

  auto prefix = Router::normalize_path(path_prefix);
  for (auto& existing : services_) {
    if (existing.path_prefix == prefix) {
      throw core::ValidationException(kj::str("path prefix ", prefix, " is claimed by both '",
                                              existing.service, "' and '", service, "'"));
    }
  }
  services_.add(ServiceRoutes{kj::str(service), kj::mv(prefix), kj::Vector<RouteRule>()});
}

void RouteTable::add_rule(kj::StringPtr service, kj::Maybe<kj::HttpMethod> method,
                          kj::StringPtr pattern, kj::Maybe<bool> idempotent) {
  for (auto& entry : services_) {
    if (entry.service == service) {
      entry.rules.add(RouteRule{method, PathPattern(Router::normalize_path(pattern)), idempotent});
      return;
    }
  }
  throw core::ValidationException(kj::str("route declared for unknown service '", service, "'"));
}

kj::Maybe<ResolvedRoute> RouteTable::resolve(kj::HttpMethod method, kj::StringPtr path) const {
  auto normalized = Router::normalize_path(path);

  const ServiceRoutes* best = nullptr;
  for (auto& entry : services_) {
    if (prefix_matches(entry.path_prefix, normalized) &&
        (best == nullptr || entry.path_prefix.size() > best->path_prefix.size())) {
      best = &entry;
    }
  }
  if (best == nullptr) {
    return kj::none;
  }

  for (auto& rule : best->rules) {
    KJ_IF_SOME(rule_method, rule.method) {
      if (rule_method != method) {
        continue;
      }
    }
    if (rule.pattern.match(normalized)) {
      bool idempotent = default_idempotent(method);
      KJ_IF_SOME(declared, rule.idempotent) {
        idempotent = declared;
      }
      return ResolvedRoute{best->service, rule.pattern.text(), idempotent};
    }
  }

  return ResolvedRoute{best->service, best->path_prefix, default_idempotent(method)};
}

kj::Own<RouteTable> RouteTable::from_catalog(const core::JsonValue& root) {
  auto table = kj::heap<RouteTable>();

  root["services"].for_each_array([&](const core::JsonValue& service) {
    auto name = service["name"].get_string();
    if (name.size() == 0) {
      throw core::ValidationException("catalog service entry is missing its name"_kj);
    }
    auto prefix = service["path_prefix"].get_string(kj::str("/", name));
    table->add_service(name, prefix);

    service["routes"].for_each_array([&](const core::JsonValue& route) {
      kj::Maybe<kj::HttpMethod> method;
      auto method_name = route["method"].get_string("*"_kj);
      if (method_name != "*"_kj) {
        KJ_IF_SOME(parsed, kj::tryParseHttpMethod(method_name)) {
          method = parsed;
        } else {
          throw core::ValidationException(
              kj::str("unknown method '", method_name, "' in routes of '", name, "'"));
        }
      }

      auto pattern = route["path"].get_string();
      if (pattern.size() == 0) {
        throw core::ValidationException(kj::str("route of '", name, "' is missing its path"));
      }

      kj::Maybe<bool> idempotent;
      auto declared = route["idempotent"];
      if (declared.is_bool()) {
        idempotent = declared.get_bool();
      }
      table->add_rule(name, method, pattern, idempotent);
    });
  });

  KJ_LOG(INFO, "Route table loaded", table->service_count());
  return table;
}

} // namespace aegis::gateway
