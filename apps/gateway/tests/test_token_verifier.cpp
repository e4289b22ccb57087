#include "auth/token_verifier.h"

#include <kj/encoding.h>
#include <kj/test.h>

namespace aegis::gateway::auth {
namespace {

constexpr kj::StringPtr kSecret = "0123456789abcdef0123456789abcdef"_kj;

struct Clocked {
  int64_t now_ms = 1'700'000'000'000;
  TokenVerifier verifier;

  explicit Clocked(kj::StringPtr secret = kSecret)
      : verifier(secret, core::MillisClock([this]() { return now_ms; })) {}
};

kj::String unsignedToken(kj::StringPtr header, kj::StringPtr payload) {
  return kj::str(kj::encodeBase64Url(header.asBytes()), ".",
                 kj::encodeBase64Url(payload.asBytes()), ".", kj::encodeBase64Url("sig"_kj.asBytes()));
}

KJ_TEST("TokenVerifier: issued token verifies with its claims") {
  Clocked clocked;
  kj::StringPtr permissions[] = {"account:read"_kj, "orders:write"_kj};
  auto token = clocked.verifier.issue("user-42"_kj, Tier::Premium, permissions);

  auto verified = clocked.verifier.verify(token);
  auto& identity = KJ_ASSERT_NONNULL(verified);
  KJ_EXPECT(identity.authenticated);
  KJ_EXPECT(identity.subject == "user-42");
  KJ_EXPECT(identity.tier == Tier::Premium);
  KJ_EXPECT(identity.has_permission("account:read"_kj));
  KJ_EXPECT(!identity.has_permission("admin"_kj));
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::NONE);
}

KJ_TEST("TokenVerifier: expired token is rejected") {
  Clocked clocked;
  auto token = clocked.verifier.issue("user-1"_kj, Tier::Free, nullptr, 60);

  clocked.now_ms += 61'000;
  KJ_EXPECT(clocked.verifier.verify(token) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::EXPIRED);
}

KJ_TEST("TokenVerifier: token from another secret fails the signature check") {
  Clocked issuer("another-secret-another-secret-xx"_kj);
  Clocked clocked;
  auto token = issuer.verifier.issue("user-1"_kj, Tier::Basic, nullptr);

  KJ_EXPECT(clocked.verifier.verify(token) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::INVALID_SIGNATURE);
}

KJ_TEST("TokenVerifier: issued-at far in the future is rejected") {
  Clocked issuer;
  Clocked clocked;
  issuer.now_ms = clocked.now_ms + 120'000;
  auto token = issuer.verifier.issue("user-1"_kj, Tier::Free, nullptr);

  KJ_EXPECT(clocked.verifier.verify(token) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::FUTURE_ISSUED);
}

KJ_TEST("TokenVerifier: algorithms other than HS256 are refused") {
  Clocked clocked;
  auto token = unsignedToken("{\"alg\":\"none\",\"typ\":\"JWT\"}"_kj,
                             "{\"sub\":\"mallory\",\"iat\":1700000000,\"exp\":1800000000}"_kj);

  KJ_EXPECT(clocked.verifier.verify(token) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::ALGORITHM_MISMATCH);
}

KJ_TEST("TokenVerifier: missing claims are reported") {
  Clocked clocked;
  auto token = unsignedToken("{\"alg\":\"HS256\"}"_kj, "{\"sub\":\"mallory\"}"_kj);

  KJ_EXPECT(clocked.verifier.verify(token) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::MISSING_CLAIMS);
}

KJ_TEST("TokenVerifier: malformed tokens never throw") {
  Clocked clocked;
  KJ_EXPECT(clocked.verifier.verify("not-a-token"_kj) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::INVALID_FORMAT);

  KJ_EXPECT(clocked.verifier.verify("a.b.c.d"_kj) == kj::none);
  KJ_EXPECT(clocked.verifier.last_error() == TokenError::INVALID_FORMAT);

  KJ_EXPECT(clocked.verifier.verify(""_kj) == kj::none);
}

KJ_TEST("TokenVerifier: empty secret is a configuration error") {
  KJ_EXPECT_THROW_MESSAGE("token secret must not be empty", { TokenVerifier verifier(""_kj); });
}

KJ_TEST("bearer_token: extracts the credential") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(bearer_token("Bearer abc.def.ghi"_kj)) == "abc.def.ghi");
  KJ_EXPECT(KJ_ASSERT_NONNULL(bearer_token("bearer   xyz"_kj)) == "xyz");
  KJ_EXPECT(bearer_token("Basic dXNlcjpwYXNz"_kj) == kj::none);
  KJ_EXPECT(bearer_token("Bearer "_kj) == kj::none);
  KJ_EXPECT(bearer_token(""_kj) == kj::none);
}

KJ_TEST("Identity: tiers are ordered and anonymous holds nothing") {
  auto anonymous = Identity::anonymous();
  KJ_EXPECT(!anonymous.authenticated);
  KJ_EXPECT(!anonymous.has_tier(Tier::Free));

  Identity premium;
  premium.authenticated = true;
  premium.subject = kj::str("p");
  premium.tier = Tier::Premium;
  KJ_EXPECT(premium.has_tier(Tier::Basic));
  KJ_EXPECT(premium.has_tier(Tier::Premium));
  KJ_EXPECT(!premium.has_tier(Tier::Enterprise));

  auto copy = premium.clone();
  KJ_EXPECT(copy.subject == "p");
  KJ_EXPECT(copy.tier == Tier::Premium);

  KJ_EXPECT(KJ_ASSERT_NONNULL(parse_tier("enterprise"_kj)) == Tier::Enterprise);
  KJ_EXPECT(parse_tier("gold"_kj) == kj::none);
  KJ_EXPECT(to_string(Tier::Basic) == "basic");
}

} // namespace
} // namespace aegis::gateway::auth
