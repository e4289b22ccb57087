#include "aegis/proxy/upstream.h"

#include "aegis/proxy/header_rewriter.h"

#include <kj/debug.h>

namespace aegis::proxy {

kj::Maybe<kj::StringPtr> find_header(const HeaderList& headers, kj::StringPtr name) {
  for (const auto& header : headers) {
    if (header_name_equals(header.name, name)) {
      return kj::StringPtr(header.value);
    }
  }
  return kj::none;
}

kj::Promise<UpstreamResponse> HttpUpstreamTransport::send(UpstreamRequest request) {
  auto address = co_await network_.parseAddress(request.address, request.port);

  kj::HttpClientSettings settings;
  settings.idleTimeout = 30 * kj::SECONDS;
  auto client = kj::newHttpClient(timer_, header_table_, *address, kj::mv(settings));

  kj::HttpHeaders headers(header_table_);
  copy_to_kj_headers(request.headers, headers);
  headers.set(kj::HttpHeaderId::HOST, request.authority);

  kj::Maybe<uint64_t> body_size;
  if (request.body.size() > 0 || !method_allows_empty_body(request.method)) {
    body_size = request.body.size();
  }

  auto call = client->request(request.method, request.path_and_query, headers, body_size);
  if (request.body.size() > 0) {
    co_await call.body->write(request.body.begin(), request.body.size());
  }
  call.body = nullptr;

  auto response = co_await kj::mv(call.response);
  auto body = co_await response.body->readAllBytes();

  UpstreamResponse result;
  result.status = response.statusCode;
  result.status_text = kj::str(response.statusText);
  result.headers = copy_from_kj_headers(*response.headers);
  result.body = kj::mv(body);
  KJ_LOG(DBG, "Upstream responded", request.path_and_query, result.status, result.body.size());
  co_return result;
}

} // namespace aegis::proxy
