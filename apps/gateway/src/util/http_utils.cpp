#include "util/http_utils.h"

#include <kj/encoding.h>

namespace aegis::gateway::util {

namespace {

bool equalsIgnoreCase(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    char x = a[i];
    char y = b[i];
    if (x >= 'A' && x <= 'Z') {
      x = static_cast<char>(x - 'A' + 'a');
    }
    if (y >= 'A' && y <= 'Z') {
      y = static_cast<char>(y - 'A' + 'a');
    }
    if (x != y) {
      return false;
    }
  }
  return true;
}

kj::String trim(kj::ArrayPtr<const char> text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) {
    ++begin;
  }
  while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
    --end;
  }
  return kj::str(text.slice(begin, end));
}

} // namespace

kj::Maybe<kj::StringPtr> getHeader(const kj::HttpHeaders& headers, kj::StringPtr name) {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr headerName, kj::StringPtr headerValue) {
    if (result == kj::none && equalsIgnoreCase(headerName, name)) {
      result = headerValue;
    }
  });
  return result;
}

kj::String getClientIP(const kj::HttpHeaders& headers) {
  KJ_IF_SOME(forwarded, getHeader(headers, "X-Forwarded-For"_kj)) {
    auto first = forwarded.asArray();
    KJ_IF_SOME(comma, forwarded.findFirst(',')) {
      first = forwarded.slice(0, comma);
    }
    auto ip = trim(first);
    if (ip.size() > 0) {
      return ip;
    }
  }
  KJ_IF_SOME(real, getHeader(headers, "X-Real-IP"_kj)) {
    auto ip = trim(real.asArray());
    if (ip.size() > 0) {
      return ip;
    }
  }
  return kj::str("unknown");
}

kj::Maybe<kj::String> getQueryParam(kj::StringPtr query, kj::StringPtr name) {
  kj::StringPtr remaining = query;
  while (remaining.size() > 0) {
    kj::ArrayPtr<const char> pair = remaining.asArray();
    KJ_IF_SOME(amp, remaining.findFirst('&')) {
      pair = remaining.slice(0, amp);
      remaining = remaining.slice(amp + 1);
    } else {
      remaining = ""_kj;
    }

    kj::ArrayPtr<const char> key = pair;
    kj::ArrayPtr<const char> value = nullptr;
    for (size_t i = 0; i < pair.size(); ++i) {
      if (pair[i] == '=') {
        key = pair.slice(0, i);
        value = pair.slice(i + 1, pair.size());
        break;
      }
    }
    if (key == name.asArray()) {
      auto decoded = kj::decodeUriComponent(value);
      if (decoded.hadErrors) {
        return kj::none;
      }
      return kj::mv(decoded);
    }
  }
  return kj::none;
}

kj::String retryAfterSeconds(int64_t retryAfterMs) {
  int64_t seconds = (retryAfterMs + 999) / 1000;
  if (seconds < 1) {
    seconds = 1;
  }
  return kj::str(seconds);
}

bool isSafeMethod(kj::HttpMethod method) {
  return method == kj::HttpMethod::GET || method == kj::HttpMethod::HEAD;
}

kj::StringPtr statusText(uint32_t status) {
  switch (status) {
  case 200:
    return "OK"_kj;
  case 202:
    return "Accepted"_kj;
  case 400:
    return "Bad Request"_kj;
  case 401:
    return "Unauthorized"_kj;
  case 403:
    return "Forbidden"_kj;
  case 404:
    return "Not Found"_kj;
  case 405:
    return "Method Not Allowed"_kj;
  case 429:
    return "Too Many Requests"_kj;
  case 500:
    return "Internal Server Error"_kj;
  case 502:
    return "Bad Gateway"_kj;
  case 503:
    return "Service Unavailable"_kj;
  case 504:
    return "Gateway Timeout"_kj;
  default:
    return "Unknown"_kj;
  }
}

} // namespace aegis::gateway::util
