#pragma once

#include "aegis/core/error.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace aegis::gateway::realtime {

enum class ClientAction {
  Subscribe,
  Unsubscribe,
  Ping,
};

/**
 * @brief Decoded client frame
 *
 * {"action":"subscribe"|"unsubscribe","channels":[...]} or {"action":"ping"}
 */
struct ClientFrame {
  ClientAction action{ClientAction::Ping};
  kj::Vector<kj::String> channels;
};

struct FrameError {
  core::ErrorCode code{core::ErrorCode::ParseError};
  kj::String message;
};

using ParsedFrame = kj::OneOf<ClientFrame, FrameError>;

/**
 * @brief Decode one text frame
 *
 * Anything other than a well-formed frame of a known action yields a
 * PARSE_ERROR; subscribe and unsubscribe need a non-empty array of strings.
 */
[[nodiscard]] ParsedFrame parse_client_frame(kj::StringPtr text);

// Server frames
[[nodiscard]] kj::String connected_frame(uint64_t connection_id, bool authenticated);
[[nodiscard]] kj::String subscribed_frame(kj::StringPtr channel);
[[nodiscard]] kj::String unsubscribed_frame(kj::StringPtr channel);
[[nodiscard]] kj::String subscription_error_frame(kj::StringPtr channel, core::ErrorCode code,
                                                  kj::StringPtr reason);
// payload_json is embedded as JSON; text that is not JSON is sent as a string
[[nodiscard]] kj::String event_frame(kj::StringPtr channel, kj::StringPtr event,
                                     kj::StringPtr payload_json);
// Account-scoped delivery: {"event":...,"payload":...} without a channel
[[nodiscard]] kj::String direct_frame(kj::StringPtr event, kj::StringPtr payload_json);
[[nodiscard]] kj::String pong_frame();
[[nodiscard]] kj::String error_frame(core::ErrorCode code, kj::StringPtr message);

} // namespace aegis::gateway::realtime
