#pragma once

#include "aegis/proxy/upstream.h"

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/string.h>

namespace aegis::proxy {

// ASCII case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(kj::StringPtr a, kj::StringPtr b);

/**
 * @brief connection, keep-alive, transfer-encoding, upgrade, proxy-authenticate,
 * proxy-authorization, te and trailer
 */
[[nodiscard]] bool is_hop_by_hop(kj::StringPtr name);

/**
 * @brief Copy without hop-by-hop headers
 *
 * Also drops every header named in a `Connection` header's token list, and the
 * framing headers (Content-Length, Host) that the HTTP layer recomputes per hop.
 */
[[nodiscard]] HeaderList strip_hop_by_hop(const HeaderList& headers);

struct ForwardedInfo {
  kj::StringPtr client_ip;
  kj::StringPtr proto;
  kj::StringPtr host;
};

/**
 * @brief Inject X-Forwarded-For, X-Forwarded-Proto and X-Forwarded-Host
 *
 * X-Forwarded-For is appended to any existing chain; the other two are replaced.
 */
void add_forwarded_headers(HeaderList& headers, const ForwardedInfo& info);

/**
 * @brief Remove the API version prefix from an inbound path
 *
 * Strips `configured_prefix` when it matches on a segment boundary, otherwise any
 * leading `/api/v<digits>`. The result always starts with '/'.
 */
[[nodiscard]] kj::String strip_version_prefix(kj::StringPtr path, kj::StringPtr configured_prefix);

[[nodiscard]] HeaderList copy_from_kj_headers(const kj::HttpHeaders& headers);
void copy_to_kj_headers(const HeaderList& headers, kj::HttpHeaders& out);

// GET, HEAD, DELETE and OPTIONS may be sent without any body framing
[[nodiscard]] bool method_allows_empty_body(kj::HttpMethod method);

} // namespace aegis::proxy
