#include "aegis/core/json.h"
#include "realtime/websocket_session.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/test.h>

namespace aegis::gateway::realtime {
namespace {

constexpr kj::StringPtr kSecret = "0123456789abcdef0123456789abcdef"_kj;

kj::String receiveText(kj::WebSocket& socket, kj::WaitScope& waitScope) {
  auto message = socket.receive().wait(waitScope);
  KJ_ASSERT(message.is<kj::String>(), "expected a text frame");
  return kj::mv(message.get<kj::String>());
}

// =============================================================================
// identify_client
// =============================================================================

KJ_TEST("identify_client: bearer header wins over query token") {
  kj::HttpHeaderTable headerTable;
  auth::TokenVerifier verifier(kSecret);
  auto token = verifier.issue("user-7"_kj, auth::Tier::Premium, nullptr);
  auto header = kj::str("Bearer ", token);

  kj::HttpHeaders headers(headerTable);
  headers.addPtrPtr("Authorization"_kj, header);

  auto identity = identify_client(verifier, headers, "token=garbage"_kj);
  KJ_EXPECT(identity.authenticated);
  KJ_EXPECT(identity.subject == "user-7");
  KJ_EXPECT(identity.tier == auth::Tier::Premium);
}

KJ_TEST("identify_client: token query parameter when no header") {
  kj::HttpHeaderTable headerTable;
  auth::TokenVerifier verifier(kSecret);
  auto token = verifier.issue("user-8"_kj, auth::Tier::Basic, nullptr);

  kj::HttpHeaders headers(headerTable);
  auto query = kj::str("lang=en&token=", token);
  auto identity = identify_client(verifier, headers, query);
  KJ_EXPECT(identity.authenticated);
  KJ_EXPECT(identity.subject == "user-8");
}

KJ_TEST("identify_client: invalid or missing token is anonymous") {
  kj::HttpHeaderTable headerTable;
  auth::TokenVerifier verifier(kSecret);
  kj::HttpHeaders headers(headerTable);

  KJ_EXPECT(!identify_client(verifier, headers, "token=not.a.jwt"_kj).authenticated);
  KJ_EXPECT(!identify_client(verifier, headers, ""_kj).authenticated);
}

// =============================================================================
// WebSocketSession
// =============================================================================

KJ_TEST("WebSocketSession: subscribe, receive a broadcast, close") {
  auto io = kj::setupAsyncIo();
  FanoutGateway gateway;
  auto pipe = kj::newWebSocketPipe();
  auto& client = *pipe.ends[1];

  auto opened = gateway.open(auth::Identity::anonymous());
  auto& connection = KJ_ASSERT_NONNULL(opened);
  WebSocketSession session(gateway, io.provider->getTimer(), kj::mv(pipe.ends[0]),
                           kj::mv(connection));
  auto running = session.run().eagerlyEvaluate(nullptr);

  auto hello = core::JsonDocument::parse(receiveText(client, io.waitScope));
  KJ_EXPECT(hello.root()["event"_kj].get_string() == "connected");
  KJ_EXPECT(!hello.root()["authenticated"_kj].get_bool());

  client.send(R"({"action":"subscribe","channels":["announcements"]})"_kj.asArray())
      .wait(io.waitScope);
  KJ_EXPECT(receiveText(client, io.waitScope) ==
            R"({"event":"subscribed","channel":"announcements"})");

  KJ_EXPECT(gateway.broadcast("announcements"_kj, "maintenance"_kj, R"({"at":"02:00"})"_kj) ==
            1);
  auto event = core::JsonDocument::parse(receiveText(client, io.waitScope));
  KJ_EXPECT(event.root()["event"_kj].get_string() == "maintenance");
  KJ_EXPECT(event.root()["channel"_kj].get_string() == "announcements");

  client.send(R"({"action":"ping"})"_kj.asArray()).wait(io.waitScope);
  KJ_EXPECT(receiveText(client, io.waitScope) == R"({"event":"pong"})");

  client.close(1000, "bye"_kj).wait(io.waitScope);
  auto closing = client.receive().wait(io.waitScope);
  KJ_ASSERT(closing.is<kj::WebSocket::Close>());
  KJ_EXPECT(closing.get<kj::WebSocket::Close>().code == 1000);

  running.wait(io.waitScope);
  KJ_EXPECT(gateway.stats().connections == 0);
}

KJ_TEST("WebSocketSession: malformed frames get an error frame and the socket stays open") {
  auto io = kj::setupAsyncIo();
  FanoutGateway gateway;
  auto pipe = kj::newWebSocketPipe();
  auto& client = *pipe.ends[1];

  auto opened = gateway.open(auth::Identity::anonymous());
  auto& connection = KJ_ASSERT_NONNULL(opened);
  WebSocketSession session(gateway, io.provider->getTimer(), kj::mv(pipe.ends[0]),
                           kj::mv(connection));
  auto running = session.run().eagerlyEvaluate(nullptr);
  receiveText(client, io.waitScope);

  client.send("{not json"_kj.asArray()).wait(io.waitScope);
  auto error = core::JsonDocument::parse(receiveText(client, io.waitScope));
  KJ_EXPECT(error.root()["event"_kj].get_string() == "error");
  KJ_EXPECT(error.root()["code"_kj].get_string() == "PARSE_ERROR");

  client.send(R"({"action":"ping"})"_kj.asArray()).wait(io.waitScope);
  KJ_EXPECT(receiveText(client, io.waitScope) == R"({"event":"pong"})");

  client.close(1000, ""_kj).wait(io.waitScope);
  client.receive().wait(io.waitScope);
  running.wait(io.waitScope);
}

} // namespace
} // namespace aegis::gateway::realtime
