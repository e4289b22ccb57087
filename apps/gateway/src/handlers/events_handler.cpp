#include "handlers/events_handler.h"

#include "aegis/core/json.h"
#include "handlers/admin_handler.h"
#include "realtime/channel_policy.h"
#include "realtime/fanout_gateway.h"

#include <kj/debug.h>

namespace aegis::gateway {

namespace {

kj::String payloadJson(const core::JsonValue& root) {
  auto payload = root["payload"_kj];
  return payload.is_valid() ? payload.to_json() : kj::str("null");
}

kj::Promise<void> sendDelivered(RequestContext& ctx, size_t delivered) {
  return ctx.sendJson(200, core::JsonBuilder::object().put("delivered"_kj, delivered).build());
}

} // namespace

EventsHandler::EventsHandler(kj::StringPtr admin_token, realtime::FanoutGateway& fanout)
    : admin_token_(kj::str(admin_token)), fanout_(fanout) {}

kj::Promise<void> EventsHandler::handlePublish(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    co_await kj::mv(denied);
    co_return;
  }

  auto text = co_await ctx.readBodyAsString();
  auto maybe_doc = core::JsonDocument::try_parse(text);
  if (maybe_doc == kj::none) {
    co_await ctx.sendError(core::ErrorCode::ParseError, "body is not valid JSON"_kj);
    co_return;
  }
  auto root = KJ_ASSERT_NONNULL(maybe_doc).root();

  auto channel = root["channel"_kj].get_string();
  auto event = root["event"_kj].get_string();
  if (channel.size() == 0 || event.size() == 0) {
    co_await ctx.sendError(core::ErrorCode::ValidationError, "channel and event are required"_kj);
    co_return;
  }
  if (realtime::find_channel_rule(channel) == kj::none) {
    co_await ctx.sendError(core::ErrorCode::NotFound, "unknown channel"_kj);
    co_return;
  }

  auto delivered = fanout_.broadcast(channel, event, payloadJson(root));
  KJ_LOG(DBG, "Event published", channel, event, delivered);
  co_await sendDelivered(ctx, delivered);
}

kj::Promise<void> EventsHandler::handleNotify(RequestContext& ctx) {
  auto maybeDenied = requireAdmin(ctx, admin_token_);
  KJ_IF_SOME(denied, maybeDenied) {
    co_await kj::mv(denied);
    co_return;
  }

  auto text = co_await ctx.readBodyAsString();
  auto maybe_doc = core::JsonDocument::try_parse(text);
  if (maybe_doc == kj::none) {
    co_await ctx.sendError(core::ErrorCode::ParseError, "body is not valid JSON"_kj);
    co_return;
  }
  auto root = KJ_ASSERT_NONNULL(maybe_doc).root();

  auto identity = root["identity"_kj].get_string();
  auto event = root["event"_kj].get_string();
  if (identity.size() == 0 || event.size() == 0) {
    co_await ctx.sendError(core::ErrorCode::ValidationError, "identity and event are required"_kj);
    co_return;
  }

  auto delivered = fanout_.broadcast_to_identity(identity, event, payloadJson(root));
  KJ_LOG(DBG, "Identity notified", identity, event, delivered);
  co_await sendDelivered(ctx, delivered);
}

} // namespace aegis::gateway
