#pragma once

#include "auth/identity.h"
#include "auth/token_verifier.h"
#include "realtime/connection.h"
#include "realtime/fanout_gateway.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/timer.h>

namespace aegis::gateway::realtime {

/**
 * @brief Identity for a WebSocket handshake
 *
 * Takes the bearer token from the Authorization header, or the `token` query
 * parameter when the header is absent. Missing or invalid tokens yield an
 * anonymous identity; the connection is still accepted.
 */
[[nodiscard]] auth::Identity identify_client(const auth::TokenVerifier& verifier,
                                             const kj::HttpHeaders& headers,
                                             kj::StringPtr query_string);

/**
 * @brief Drives one accepted WebSocket
 *
 * Two loops run side by side: the receive loop decodes client frames and
 * applies them to the FanoutGateway, the send loop drains the connection's
 * bounded queue into the socket. Every outbound frame, replies included, goes
 * through the queue so the socket only ever has one send in flight.
 *
 * The receive loop ends on a client close, a transport error or the idle
 * timeout; it then disconnects from the gateway, which closes the queue and
 * lets the send loop finish with a close frame.
 */
class WebSocketSession {
public:
  WebSocketSession(FanoutGateway& gateway, kj::Timer& timer, kj::Own<kj::WebSocket> socket,
                   kj::Own<Connection> connection);

  KJ_DISALLOW_COPY_AND_MOVE(WebSocketSession);

  kj::Promise<void> run();

  /**
   * @brief Accept the upgrade and serve the socket until it closes
   *
   * Over the connection limit the socket receives an error frame and is
   * closed with 1013 (try again later).
   */
  static kj::Promise<void> serve(FanoutGateway& gateway, kj::Timer& timer,
                                 const auth::TokenVerifier& verifier,
                                 const kj::HttpHeaders& headers, kj::StringPtr query_string,
                                 const kj::HttpHeaderTable& header_table,
                                 kj::HttpService::Response& response);

  static constexpr uint16_t kCloseNormal = 1000;
  static constexpr uint16_t kCloseTryAgainLater = 1013;

private:
  kj::Promise<void> receive_loop();
  kj::Promise<void> send_loop();
  void handle_text(kj::StringPtr text);
  void on_receive_error(kj::Exception&& exception);
  void reply(kj::String frame);

  FanoutGateway& gateway_;
  kj::Timer& timer_;
  kj::Own<kj::WebSocket> socket_;
  kj::Own<Connection> connection_;

  uint16_t close_code_{kCloseNormal};
  kj::String close_reason_;
  bool peer_gone_{false};
};

} // namespace aegis::gateway::realtime
