#include "realtime/websocket_session.h"

#include "realtime/frame_codec.h"
#include "util/http_utils.h"

#include <kj/debug.h>

namespace aegis::gateway::realtime {

auth::Identity identify_client(const auth::TokenVerifier& verifier, const kj::HttpHeaders& headers,
                               kj::StringPtr query_string) {
  kj::Maybe<kj::String> token;
  KJ_IF_SOME(authorization, util::getHeader(headers, "Authorization"_kj)) {
    KJ_IF_SOME(bearer, auth::bearer_token(authorization)) {
      token = kj::str(bearer);
    }
  }
  if (token == kj::none) {
    token = util::getQueryParam(query_string, "token"_kj);
  }

  KJ_IF_SOME(value, token) {
    auto verified = verifier.verify(value);
    KJ_IF_SOME(identity, verified) {
      return kj::mv(identity);
    }
    KJ_LOG(INFO, "WebSocket token rejected, continuing as anonymous",
           auth::to_string(verifier.last_error()));
  }
  return auth::Identity::anonymous();
}

WebSocketSession::WebSocketSession(FanoutGateway& gateway, kj::Timer& timer,
                                   kj::Own<kj::WebSocket> socket, kj::Own<Connection> connection)
    : gateway_(gateway), timer_(timer), socket_(kj::mv(socket)), connection_(kj::mv(connection)),
      close_reason_(kj::str()) {}

kj::Promise<void> WebSocketSession::serve(FanoutGateway& gateway, kj::Timer& timer,
                                          const auth::TokenVerifier& verifier,
                                          const kj::HttpHeaders& headers,
                                          kj::StringPtr query_string,
                                          const kj::HttpHeaderTable& header_table,
                                          kj::HttpService::Response& response) {
  auto identity = identify_client(verifier, headers, query_string);

  kj::HttpHeaders response_headers(header_table);
  auto socket = response.acceptWebSocket(response_headers);

  auto maybe_connection = gateway.open(kj::mv(identity));
  KJ_IF_SOME(connection, maybe_connection) {
    auto session = kj::heap<WebSocketSession>(gateway, timer, kj::mv(socket), kj::mv(connection));
    co_await session->run();
  }
  else {
    auto frame = error_frame(core::ErrorCode::ResourceExhausted, "connection limit reached"_kj);
    co_await socket->send(frame.asArray());
    co_await socket->close(kCloseTryAgainLater, "connection limit reached"_kj);
  }
}

kj::Promise<void> WebSocketSession::run() {
  auto id = connection_->id();
  auto authenticated = connection_->identity().authenticated;
  KJ_LOG(INFO, "WebSocket connected", id, authenticated);
  reply(connected_frame(id, authenticated));

  auto receiving = receive_loop()
                       .catch_([this](kj::Exception&& exception) {
                         on_receive_error(kj::mv(exception));
                       })
                       .then([this]() { gateway_.disconnect(connection_->id()); });

  auto sending = send_loop().catch_([this](kj::Exception&& exception) {
    KJ_LOG(INFO, "WebSocket send failed", connection_->id(), exception.getDescription());
    peer_gone_ = true;
    gateway_.disconnect(connection_->id());
    socket_->abort();
  });

  co_await kj::joinPromises(kj::arr(kj::mv(receiving), kj::mv(sending)));
  KJ_LOG(INFO, "WebSocket closed", id, close_code_);
}

kj::Promise<void> WebSocketSession::receive_loop() {
  auto idle_timeout = gateway_.config().idle_timeout_ms * kj::MILLISECONDS;

  for (;;) {
    auto message = co_await timer_.timeoutAfter(idle_timeout, socket_->receive());

    if (message.is<kj::WebSocket::Close>()) {
      auto& close = message.get<kj::WebSocket::Close>();
      KJ_LOG(INFO, "WebSocket closed by client", connection_->id(), close.code);
      close_code_ = kCloseNormal;
      co_return;
    }

    KJ_IF_SOME(text, message.tryGet<kj::String>()) {
      handle_text(text);
    }
    else {
      reply(error_frame(core::ErrorCode::ParseError, "binary frames are not supported"_kj));
    }
  }
}

kj::Promise<void> WebSocketSession::send_loop() {
  for (;;) {
    auto next = co_await connection_->next_frame();
    if (next == kj::none) {
      break;
    }
    auto& frame = KJ_ASSERT_NONNULL(next);
    co_await socket_->send(frame.asArray());
  }

  // Queue closed: either the receive loop ended or the gateway dropped us
  if (!peer_gone_) {
    co_await socket_->close(close_code_, close_reason_);
  }
}

void WebSocketSession::handle_text(kj::StringPtr text) {
  auto parsed = parse_client_frame(text);
  KJ_IF_SOME(error, parsed.tryGet<FrameError>()) {
    reply(error_frame(error.code, error.message));
    return;
  }

  auto& frame = parsed.get<ClientFrame>();
  auto id = connection_->id();
  auto kind = frame.action == ClientAction::Ping ? MessageKind::Ping : MessageKind::Subscription;
  if (!gateway_.allow_message(id, kind)) {
    reply(error_frame(core::ErrorCode::RateLimited, "too many messages"_kj));
    return;
  }

  switch (frame.action) {
  case ClientAction::Ping:
    reply(pong_frame());
    break;
  case ClientAction::Subscribe: {
    auto result = gateway_.subscribe(id, frame.channels.asPtr());
    for (auto& channel : result.accepted) {
      reply(subscribed_frame(channel));
    }
    for (auto& rejected : result.rejected) {
      reply(subscription_error_frame(rejected.channel, rejected.code, rejected.reason));
    }
    break;
  }
  case ClientAction::Unsubscribe:
    gateway_.unsubscribe(id, frame.channels.asPtr());
    for (auto& channel : frame.channels) {
      reply(unsubscribed_frame(channel));
    }
    break;
  }
}

void WebSocketSession::on_receive_error(kj::Exception&& exception) {
  switch (exception.getType()) {
  case kj::Exception::Type::OVERLOADED:
    // timeoutAfter() rejects with OVERLOADED
    KJ_LOG(INFO, "WebSocket idle timeout", connection_->id());
    close_code_ = kCloseNormal;
    close_reason_ = kj::str("idle timeout");
    break;
  case kj::Exception::Type::DISCONNECTED:
    peer_gone_ = true;
    break;
  default:
    KJ_LOG(WARNING, "WebSocket receive failed", connection_->id(), exception.getDescription());
    close_code_ = 1011;
    close_reason_ = kj::str("internal error");
    break;
  }
}

void WebSocketSession::reply(kj::String frame) {
  // A full queue drops the frame and counts it like any broadcast
  connection_->enqueue(kj::mv(frame));
}

} // namespace aegis::gateway::realtime
