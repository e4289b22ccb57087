#include "aegis/core/json.h"
#include "realtime/frame_codec.h"

#include <kj/test.h>

namespace aegis::gateway::realtime {
namespace {

const FrameError& expectError(const ParsedFrame& parsed) {
  KJ_ASSERT(parsed.is<FrameError>(), "expected a parse error");
  return parsed.get<FrameError>();
}

KJ_TEST("parse_client_frame: subscribe with channels") {
  auto parsed =
      parse_client_frame(R"({"action":"subscribe","channels":["prices.basic","market.ETH"]})"_kj);
  KJ_ASSERT(parsed.is<ClientFrame>());
  auto& frame = parsed.get<ClientFrame>();
  KJ_EXPECT(frame.action == ClientAction::Subscribe);
  KJ_ASSERT(frame.channels.size() == 2);
  KJ_EXPECT(frame.channels[0] == "prices.basic");
  KJ_EXPECT(frame.channels[1] == "market.ETH");
}

KJ_TEST("parse_client_frame: unsubscribe and ping") {
  auto unsubscribe = parse_client_frame(R"({"action":"unsubscribe","channels":["a"]})"_kj);
  KJ_ASSERT(unsubscribe.is<ClientFrame>());
  KJ_EXPECT(unsubscribe.get<ClientFrame>().action == ClientAction::Unsubscribe);

  auto ping = parse_client_frame(R"({"action":"ping"})"_kj);
  KJ_ASSERT(ping.is<ClientFrame>());
  KJ_EXPECT(ping.get<ClientFrame>().action == ClientAction::Ping);
  KJ_EXPECT(ping.get<ClientFrame>().channels.size() == 0);
}

KJ_TEST("parse_client_frame: malformed frames are PARSE_ERROR") {
  KJ_EXPECT(expectError(parse_client_frame("{not json"_kj)).code == core::ErrorCode::ParseError);
  KJ_EXPECT(expectError(parse_client_frame("[1,2]"_kj)).code == core::ErrorCode::ParseError);
  KJ_EXPECT(expectError(parse_client_frame(R"({"channels":["a"]})"_kj)).code ==
            core::ErrorCode::ParseError);

  auto unknown = parse_client_frame(R"({"action":"publish"})"_kj);
  KJ_EXPECT(expectError(unknown).message == "unknown action 'publish'");

  expectError(parse_client_frame(R"({"action":"subscribe"})"_kj));
  expectError(parse_client_frame(R"({"action":"subscribe","channels":[]})"_kj));
  expectError(parse_client_frame(R"({"action":"subscribe","channels":"prices.basic"})"_kj));
  expectError(parse_client_frame(R"({"action":"subscribe","channels":["ok",42]})"_kj));
  expectError(parse_client_frame(R"({"action":"subscribe","channels":[""]})"_kj));
}

KJ_TEST("server frames: fixed shapes") {
  KJ_EXPECT(connected_frame(7, false) ==
            R"({"event":"connected","connectionId":7,"authenticated":false})");
  KJ_EXPECT(subscribed_frame("prices.basic"_kj) ==
            R"({"event":"subscribed","channel":"prices.basic"})");
  KJ_EXPECT(unsubscribed_frame("prices.basic"_kj) ==
            R"({"event":"unsubscribed","channel":"prices.basic"})");
  KJ_EXPECT(pong_frame() == R"({"event":"pong"})");
}

KJ_TEST("server frames: errors carry code names") {
  auto rejected =
      subscription_error_frame("prices.vip"_kj, core::ErrorCode::Forbidden, "tier too low"_kj);
  auto doc = core::JsonDocument::parse(rejected);
  auto root = doc.root();
  KJ_EXPECT(root["event"_kj].get_string() == "subscription_error");
  KJ_EXPECT(root["channel"_kj].get_string() == "prices.vip");
  KJ_EXPECT(root["code"_kj].get_string() == "FORBIDDEN");
  KJ_EXPECT(root["message"_kj].get_string() == "tier too low");

  auto error = core::JsonDocument::parse(error_frame(core::ErrorCode::RateLimited, "slow down"_kj));
  KJ_EXPECT(error.root()["code"_kj].get_string() == "RATE_LIMITED");
}

KJ_TEST("server frames: payloads are embedded verbatim") {
  auto frame = event_frame("prices.basic"_kj, "tick"_kj, R"({"symbol":"BTC","price":101.5})"_kj);
  KJ_EXPECT(frame ==
            R"({"event":"tick","channel":"prices.basic","payload":{"symbol":"BTC","price":101.5}})");

  auto direct = direct_frame("order.filled"_kj, "[1,2,3]"_kj);
  KJ_EXPECT(direct == R"({"event":"order.filled","payload":[1,2,3]})");
}

} // namespace
} // namespace aegis::gateway::realtime
