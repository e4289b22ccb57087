#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace aegis::proxy {

struct HeaderField {
  kj::String name;
  kj::String value;
};

/**
 * @brief Header list independent of any kj::HttpHeaderTable
 *
 * Keeps duplicate names and their order, as they arrived.
 */
using HeaderList = kj::Vector<HeaderField>;

[[nodiscard]] kj::Maybe<kj::StringPtr> find_header(const HeaderList& headers, kj::StringPtr name);

struct UpstreamRequest {
  kj::HttpMethod method{kj::HttpMethod::GET};
  kj::String address;
  uint16_t port{0};
  kj::String authority;
  kj::String path_and_query;
  HeaderList headers;
  kj::Array<kj::byte> body;
};

struct UpstreamResponse {
  uint32_t status{0};
  kj::String status_text;
  HeaderList headers;
  kj::Array<kj::byte> body;
};

/**
 * @brief Sends one request to one concrete instance
 *
 * Connection failures reject the promise (DISCONNECTED for refused or reset).
 * Any HTTP status, 5xx included, resolves normally.
 */
class UpstreamTransport {
public:
  virtual ~UpstreamTransport() noexcept(false) = default;

  virtual kj::Promise<UpstreamResponse> send(UpstreamRequest request) = 0;
};

/**
 * @brief UpstreamTransport over kj::HttpClient, one client per request
 */
class HttpUpstreamTransport final : public UpstreamTransport {
public:
  HttpUpstreamTransport(kj::Timer& timer, kj::Network& network,
                        const kj::HttpHeaderTable& header_table)
      : timer_(timer), network_(network), header_table_(header_table) {}

  kj::Promise<UpstreamResponse> send(UpstreamRequest request) override;

private:
  kj::Timer& timer_;
  kj::Network& network_;
  const kj::HttpHeaderTable& header_table_;
};

} // namespace aegis::proxy
