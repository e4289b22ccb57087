#include "auth/token_verifier.h"

#include "aegis/core/error.h"
#include "aegis/core/json.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/vector.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace aegis::gateway::auth {

namespace {

// Tolerated clock skew for the iat claim
constexpr int64_t kIssuedAtSkewSeconds = 60;

// Base64URL (no padding) to bytes; empty on malformed input
kj::Array<kj::byte> decode_base64url(kj::ArrayPtr<const char> encoded) {
  size_t padded = (encoded.size() + 3) / 4 * 4;
  auto standard = kj::heapString(padded);
  size_t i = 0;
  for (char c : encoded) {
    standard[i++] = c == '-' ? '+' : (c == '_' ? '/' : c);
  }
  while (i < padded) {
    standard[i++] = '=';
  }

  auto result = kj::decodeBase64(standard.asArray());
  if (result.hadErrors) {
    return kj::heapArray<kj::byte>(0);
  }
  return kj::mv(result);
}

struct TokenParts {
  kj::ArrayPtr<const char> header;
  kj::ArrayPtr<const char> payload;
  kj::ArrayPtr<const char> signature;
  kj::ArrayPtr<const char> signing_input;
};

kj::Maybe<TokenParts> split_token(kj::StringPtr token) {
  size_t first_dot = token.findFirst('.').orDefault(SIZE_MAX);
  if (first_dot == SIZE_MAX || first_dot == 0) {
    return kj::none;
  }
  size_t second_dot = SIZE_MAX;
  KJ_IF_SOME(offset, token.slice(first_dot + 1).findFirst('.')) {
    second_dot = first_dot + 1 + offset;
  }
  if (second_dot == SIZE_MAX || second_dot == first_dot + 1 || second_dot == token.size() - 1) {
    return kj::none;
  }
  // A third dot is not a JWS compact serialization
  if (token.slice(second_dot + 1).findFirst('.') != kj::none) {
    return kj::none;
  }

  return TokenParts{token.slice(0, first_dot), token.slice(first_dot + 1, second_dot),
                    token.slice(second_dot + 1), token.slice(0, second_dot)};
}

} // namespace

kj::StringPtr to_string(TokenError error) {
  switch (error) {
  case TokenError::NONE:
    return "none"_kj;
  case TokenError::INVALID_FORMAT:
    return "invalid_format"_kj;
  case TokenError::INVALID_BASE64:
    return "invalid_base64"_kj;
  case TokenError::INVALID_JSON:
    return "invalid_json"_kj;
  case TokenError::ALGORITHM_MISMATCH:
    return "algorithm_mismatch"_kj;
  case TokenError::MISSING_CLAIMS:
    return "missing_claims"_kj;
  case TokenError::EXPIRED:
    return "expired"_kj;
  case TokenError::FUTURE_ISSUED:
    return "future_issued"_kj;
  case TokenError::INVALID_SIGNATURE:
    return "invalid_signature"_kj;
  }
  return "unknown"_kj;
}

kj::Maybe<kj::StringPtr> bearer_token(kj::StringPtr authorization) {
  constexpr size_t kPrefixLength = 7;
  if (authorization.size() <= kPrefixLength) {
    return kj::none;
  }
  // Scheme name is case-insensitive
  auto scheme = authorization.slice(0, kPrefixLength);
  const char expected[] = "bearer ";
  for (size_t i = 0; i < kPrefixLength; ++i) {
    char c = scheme[i];
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    if (c != expected[i]) {
      return kj::none;
    }
  }
  auto token = authorization.slice(kPrefixLength);
  while (token.size() > 0 && token[0] == ' ') {
    token = token.slice(1);
  }
  if (token.size() == 0) {
    return kj::none;
  }
  return token;
}

TokenVerifier::TokenVerifier(kj::StringPtr secret, core::MillisClock clock)
    : secret_(kj::str(secret)), clock_(kj::mv(clock)), last_error_(TokenError::NONE) {
  AEGIS_REQUIRE(secret.size() > 0, "token secret must not be empty");
}

int64_t TokenVerifier::now_seconds() const {
  return clock_() / 1000;
}

kj::Array<kj::byte> TokenVerifier::sign(kj::ArrayPtr<const kj::byte> data) const {
  auto digest = kj::heapArray<kj::byte>(EVP_MAX_MD_SIZE);
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), secret_.begin(), static_cast<int>(secret_.size()), data.begin(), data.size(),
       digest.begin(), &digest_len);
  return digest.slice(0, digest_len).attach(kj::mv(digest));
}

bool TokenVerifier::verify_signature(kj::ArrayPtr<const kj::byte> data,
                                     kj::ArrayPtr<const kj::byte> signature) const {
  auto expected = sign(data);
  if (expected.size() != signature.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.begin(), signature.begin(), expected.size()) == 0;
}

void TokenVerifier::set_last_error(TokenError error) const {
  *last_error_.lockExclusive() = error;
}

TokenError TokenVerifier::last_error() const {
  return *last_error_.lockShared();
}

kj::Maybe<Identity> TokenVerifier::verify(kj::StringPtr token) const {
  set_last_error(TokenError::NONE);

  TokenParts parts;
  KJ_IF_SOME(split, split_token(token)) {
    parts = split;
  } else {
    set_last_error(TokenError::INVALID_FORMAT);
    return kj::none;
  }

  auto header_bytes = decode_base64url(parts.header);
  auto payload_bytes = decode_base64url(parts.payload);
  auto signature = decode_base64url(parts.signature);
  if (header_bytes.size() == 0 || payload_bytes.size() == 0 || signature.size() == 0) {
    set_last_error(TokenError::INVALID_BASE64);
    return kj::none;
  }

  auto header_text = kj::heapString(header_bytes.asChars());
  auto payload_text = kj::heapString(payload_bytes.asChars());
  auto header = core::JsonDocument::try_parse(header_text);
  auto payload = core::JsonDocument::try_parse(payload_text);
  if (header == kj::none || payload == kj::none) {
    set_last_error(TokenError::INVALID_JSON);
    return kj::none;
  }
  auto header_root = KJ_ASSERT_NONNULL(header).root();
  auto claims = KJ_ASSERT_NONNULL(payload).root();
  if (!header_root.is_object() || !claims.is_object()) {
    set_last_error(TokenError::INVALID_JSON);
    return kj::none;
  }

  if (header_root["alg"].get_string() != "HS256"_kj) {
    set_last_error(TokenError::ALGORITHM_MISMATCH);
    return kj::none;
  }

  auto sub = claims["sub"];
  auto iat = claims["iat"];
  auto exp = claims["exp"];
  if (!sub.is_string() || !iat.is_number() || !exp.is_number()) {
    set_last_error(TokenError::MISSING_CLAIMS);
    return kj::none;
  }

  // Signature before time checks so expiry is never reported for forged tokens
  if (!verify_signature(parts.signing_input.asBytes(), signature)) {
    set_last_error(TokenError::INVALID_SIGNATURE);
    return kj::none;
  }

  int64_t now = now_seconds();
  if (exp.get_int() <= now) {
    set_last_error(TokenError::EXPIRED);
    return kj::none;
  }
  if (iat.get_int() > now + kIssuedAtSkewSeconds) {
    set_last_error(TokenError::FUTURE_ISSUED);
    return kj::none;
  }

  Identity identity;
  identity.authenticated = true;
  identity.subject = sub.get_string();
  KJ_IF_SOME(tier, parse_tier(claims["tier"].get_string("free"_kj))) {
    identity.tier = tier;
  } else {
    KJ_LOG(DBG, "Token carries an unknown tier, treating as free", identity.subject);
  }
  claims["permissions"].for_each_array([&](const core::JsonValue& value) {
    if (value.is_string()) {
      identity.permissions.add(value.get_string());
    }
  });
  return kj::mv(identity);
}

kj::String TokenVerifier::issue(kj::StringPtr subject, Tier tier,
                                kj::ArrayPtr<const kj::StringPtr> permissions,
                                int64_t ttl_seconds) const {
  int64_t iat = now_seconds();
  auto header = core::JsonBuilder::object().put("alg"_kj, "HS256"_kj).put("typ"_kj, "JWT"_kj).build();
  auto payload = core::JsonBuilder::object()
                     .put("sub"_kj, subject)
                     .put("iat"_kj, iat)
                     .put("exp"_kj, static_cast<int64_t>(iat + ttl_seconds))
                     .put("tier"_kj, to_string(tier))
                     .put_array("permissions"_kj,
                                [&](core::JsonBuilder& array) {
                                  for (auto permission : permissions) {
                                    array.add(permission);
                                  }
                                })
                     .build();

  auto signing_input =
      kj::str(kj::encodeBase64Url(header.asBytes()), ".", kj::encodeBase64Url(payload.asBytes()));
  auto signature = sign(signing_input.asBytes());
  return kj::str(signing_input, ".", kj::encodeBase64Url(signature));
}

} // namespace aegis::gateway::auth
