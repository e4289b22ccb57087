#include "aegis/proxy/header_rewriter.h"

#include <kj/vector.h>

namespace aegis::proxy {

namespace {

char lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

bool is_space(char c) {
  return c == ' ' || c == '\t';
}

// Header names listed in every Connection header
kj::Vector<kj::String> connection_tokens(const HeaderList& headers) {
  kj::Vector<kj::String> tokens;
  for (const auto& header : headers) {
    if (!header_name_equals(header.name, "connection"_kj)) {
      continue;
    }
    kj::StringPtr value = header.value;
    size_t pos = 0;
    while (pos <= value.size()) {
      size_t end = pos;
      while (end < value.size() && value[end] != ',') {
        ++end;
      }
      size_t first = pos;
      size_t last = end;
      while (first < last && is_space(value[first])) {
        ++first;
      }
      while (last > first && is_space(value[last - 1])) {
        --last;
      }
      if (last > first) {
        tokens.add(kj::str(value.slice(first, last)));
      }
      pos = end + 1;
    }
  }
  return tokens;
}

bool is_segment_prefix(kj::StringPtr path, kj::StringPtr prefix) {
  if (prefix.size() == 0 || !path.startsWith(prefix)) {
    return false;
  }
  return path.size() == prefix.size() || path[prefix.size()] == '/' ||
         path[prefix.size()] == '?';
}

kj::String ensure_leading_slash(kj::StringPtr rest) {
  if (rest.size() == 0) {
    return kj::str("/");
  }
  if (rest[0] != '/') {
    return kj::str("/", rest);
  }
  return kj::str(rest);
}

} // namespace

bool header_name_equals(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (lower(a[i]) != lower(b[i])) {
      return false;
    }
  }
  return true;
}

bool is_hop_by_hop(kj::StringPtr name) {
  static constexpr kj::StringPtr kHopByHop[] = {
      "connection"_kj, "keep-alive"_kj,          "transfer-encoding"_kj, "upgrade"_kj,
      "proxy-authenticate"_kj, "proxy-authorization"_kj, "te"_kj,  "trailer"_kj,
  };
  for (auto hop : kHopByHop) {
    if (header_name_equals(name, hop)) {
      return true;
    }
  }
  return false;
}

HeaderList strip_hop_by_hop(const HeaderList& headers) {
  auto listed = connection_tokens(headers);
  HeaderList kept(headers.size());
  for (const auto& header : headers) {
    if (is_hop_by_hop(header.name) || header_name_equals(header.name, "content-length"_kj) ||
        header_name_equals(header.name, "host"_kj)) {
      continue;
    }
    bool named_by_connection = false;
    for (const auto& token : listed) {
      if (header_name_equals(header.name, token)) {
        named_by_connection = true;
        break;
      }
    }
    if (!named_by_connection) {
      kept.add(HeaderField{kj::str(header.name), kj::str(header.value)});
    }
  }
  return kept;
}

void add_forwarded_headers(HeaderList& headers, const ForwardedInfo& info) {
  kj::String forwarded_for = kj::str(info.client_ip);
  HeaderList rebuilt(headers.size() + 3);
  for (auto& header : headers) {
    if (header_name_equals(header.name, "x-forwarded-for"_kj)) {
      if (header.value.size() > 0) {
        forwarded_for = kj::str(header.value, ", ", info.client_ip);
      }
      continue;
    }
    if (header_name_equals(header.name, "x-forwarded-proto"_kj) ||
        header_name_equals(header.name, "x-forwarded-host"_kj)) {
      continue;
    }
    rebuilt.add(kj::mv(header));
  }
  if (forwarded_for.size() > 0) {
    rebuilt.add(HeaderField{kj::str("X-Forwarded-For"), kj::mv(forwarded_for)});
  }
  if (info.proto.size() > 0) {
    rebuilt.add(HeaderField{kj::str("X-Forwarded-Proto"), kj::str(info.proto)});
  }
  if (info.host.size() > 0) {
    rebuilt.add(HeaderField{kj::str("X-Forwarded-Host"), kj::str(info.host)});
  }
  headers = kj::mv(rebuilt);
}

kj::String strip_version_prefix(kj::StringPtr path, kj::StringPtr configured_prefix) {
  kj::String prefix;
  if (configured_prefix.size() > 1 && configured_prefix.endsWith("/")) {
    prefix = kj::str(configured_prefix.slice(0, configured_prefix.size() - 1));
  } else if (configured_prefix != "/"_kj) {
    prefix = kj::str(configured_prefix);
  }
  if (is_segment_prefix(path, prefix)) {
    return ensure_leading_slash(path.slice(prefix.size()));
  }

  // Generic /api/v<digits>
  if (path.startsWith("/api/v"_kj)) {
    size_t pos = 6;
    while (pos < path.size() && path[pos] >= '0' && path[pos] <= '9') {
      ++pos;
    }
    if (pos > 6 && (pos == path.size() || path[pos] == '/' || path[pos] == '?')) {
      return ensure_leading_slash(path.slice(pos));
    }
  }
  return kj::str(path);
}

HeaderList copy_from_kj_headers(const kj::HttpHeaders& headers) {
  HeaderList list;
  headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    list.add(HeaderField{kj::str(name), kj::str(value)});
  });
  return list;
}

void copy_to_kj_headers(const HeaderList& headers, kj::HttpHeaders& out) {
  for (const auto& header : strip_hop_by_hop(headers)) {
    out.add(kj::str(header.name), kj::str(header.value));
  }
}

bool method_allows_empty_body(kj::HttpMethod method) {
  switch (method) {
  case kj::HttpMethod::GET:
  case kj::HttpMethod::HEAD:
  case kj::HttpMethod::DELETE:
  case kj::HttpMethod::OPTIONS:
    return true;
  default:
    return false;
  }
}

} // namespace aegis::proxy
