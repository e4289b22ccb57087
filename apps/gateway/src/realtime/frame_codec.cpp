#include "realtime/frame_codec.h"

#include "aegis/core/json.h"

namespace aegis::gateway::realtime {

namespace {

FrameError parse_error(kj::StringPtr message) {
  return FrameError{core::ErrorCode::ParseError, kj::str(message)};
}

} // namespace

ParsedFrame parse_client_frame(kj::StringPtr text) {
  auto maybe_doc = core::JsonDocument::try_parse(text);
  if (maybe_doc == kj::none) {
    return parse_error("frame is not valid JSON"_kj);
  }
  auto& doc = KJ_ASSERT_NONNULL(maybe_doc);
  auto root = doc.root();
  if (!root.is_object()) {
    return parse_error("frame must be a JSON object"_kj);
  }

  auto action = root["action"];
  if (!action.is_string()) {
    return parse_error("frame is missing its action"_kj);
  }

  ClientFrame frame;
  auto name = action.get_string();
  if (name == "ping"_kj) {
    frame.action = ClientAction::Ping;
    return kj::mv(frame);
  }
  if (name == "subscribe"_kj) {
    frame.action = ClientAction::Subscribe;
  } else if (name == "unsubscribe"_kj) {
    frame.action = ClientAction::Unsubscribe;
  } else {
    return parse_error(kj::str("unknown action '", name, "'"));
  }

  auto channels = root["channels"];
  if (!channels.is_array() || channels.size() == 0) {
    return parse_error("channels must be a non-empty array"_kj);
  }
  bool all_strings = true;
  channels.for_each_array([&](const core::JsonValue& channel) {
    if (channel.is_string() && channel.get_string().size() > 0) {
      frame.channels.add(channel.get_string());
    } else {
      all_strings = false;
    }
  });
  if (!all_strings) {
    return parse_error("channels must be non-empty strings"_kj);
  }
  return kj::mv(frame);
}

kj::String connected_frame(uint64_t connection_id, bool authenticated) {
  return core::JsonBuilder::object()
      .put("event"_kj, "connected"_kj)
      .put("connectionId"_kj, connection_id)
      .put("authenticated"_kj, authenticated)
      .build();
}

kj::String subscribed_frame(kj::StringPtr channel) {
  return core::JsonBuilder::object()
      .put("event"_kj, "subscribed"_kj)
      .put("channel"_kj, channel)
      .build();
}

kj::String unsubscribed_frame(kj::StringPtr channel) {
  return core::JsonBuilder::object()
      .put("event"_kj, "unsubscribed"_kj)
      .put("channel"_kj, channel)
      .build();
}

kj::String subscription_error_frame(kj::StringPtr channel, core::ErrorCode code,
                                    kj::StringPtr reason) {
  return core::JsonBuilder::object()
      .put("event"_kj, "subscription_error"_kj)
      .put("channel"_kj, channel)
      .put("code"_kj, core::to_string(code))
      .put("message"_kj, reason)
      .build();
}

kj::String event_frame(kj::StringPtr channel, kj::StringPtr event, kj::StringPtr payload_json) {
  return core::JsonBuilder::object()
      .put("event"_kj, event)
      .put("channel"_kj, channel)
      .put_raw("payload"_kj, payload_json)
      .build();
}

kj::String direct_frame(kj::StringPtr event, kj::StringPtr payload_json) {
  return core::JsonBuilder::object()
      .put("event"_kj, event)
      .put_raw("payload"_kj, payload_json)
      .build();
}

kj::String pong_frame() {
  return kj::str("{\"event\":\"pong\"}");
}

kj::String error_frame(core::ErrorCode code, kj::StringPtr message) {
  return core::JsonBuilder::object()
      .put("event"_kj, "error"_kj)
      .put("code"_kj, core::to_string(code))
      .put("message"_kj, message)
      .build();
}

} // namespace aegis::gateway::realtime
