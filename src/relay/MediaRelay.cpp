#include "relay/MediaRelay.h"
#include "relay/Payload.h"

#include <boost/json.hpp>

#include <iostream>

namespace walkierelay::relay {

namespace json = boost::json;

void MediaRelay::transmission(const ConnectionId& from, std::string_view event, const json::object& data) {
    const std::string channel_id = require_string(data, "channelId");
    const std::string user_id = sender_identity(ctx_.registry().lookup(from), data);

    json::object body;
    body["userId"] = user_id;
    body["timestamp"] = timestamp_or(data, ctx_.now_ms());

    std::cout << "[relay] " << user_id << " " << event << " in " << channel_id << "\n";
    fan_out(from, channel_id, event, body);
}

void MediaRelay::audio_data(const ConnectionId& from, const json::object& data) {
    const std::string channel_id = require_string(data, "channelId");
    const std::string user_id = sender_identity(ctx_.registry().lookup(from), data);
    const json::value& audio = require_field(data, "audioData");

    json::object body;
    body["userId"] = user_id;
    body["audioData"] = audio;
    body["timestamp"] = timestamp_or(data, ctx_.now_ms());

    const auto* s = audio.if_string();
    std::cout << "[relay] " << user_id << " sending audio to " << channel_id
              << " (" << (s ? s->size() : 0) << " bytes)\n";
    fan_out(from, channel_id, "audio-received", body);
}

void MediaRelay::audio_url(const ConnectionId& from, const json::object& data) {
    const std::string channel_id = require_string(data, "channelId");
    const std::string user_id = sender_identity(ctx_.registry().lookup(from), data);
    const std::string url = require_string(data, "audioUrl");

    json::object body;
    body["userId"] = user_id;
    body["audioUrl"] = url;
    body["timestamp"] = timestamp_or(data, ctx_.now_ms());

    std::cout << "[relay] " << user_id << " shared " << url << " in " << channel_id << "\n";
    fan_out(from, channel_id, "audio-message", body);
}

void MediaRelay::audio_chunk(const ConnectionId& from, const json::object& data) {
    const std::string channel_id = require_string(data, "channelId");
    const Connection* sender = ctx_.registry().lookup(from);
    if (!sender || !sender->user_id) {
        throw RelayError(ErrorCode::IdentityNotSet, "audio-chunk requires a joined identity");
    }

    json::object body;
    body["userId"] = *sender->user_id;
    body["chunk"] = require_field(data, "chunk");
    body["sequence"] = require_field(data, "sequence");
    body["timestamp"] = timestamp_or(data, ctx_.now_ms());

    // high rate: no per-chunk logging
    fan_out(from, channel_id, "audio-chunk", body);
}

void MediaRelay::announce_upload(const std::string& channel_id, const std::string& user_id,
                                 const std::string& audio_url) {
    json::object body;
    body["userId"] = user_id;
    body["audioUrl"] = audio_url;
    body["timestamp"] = ctx_.now_ms();

    std::cout << "[relay] upload by " << user_id << " announced in " << channel_id << "\n";
    ctx_.transport().broadcast(channel_id, std::nullopt, "audio-message", body);
    ctx_.directory().increment_message_count(channel_id);
}

void MediaRelay::fan_out(const ConnectionId& from, const std::string& channel_id,
                         std::string_view event, const json::object& body) {
    ctx_.transport().broadcast(channel_id, from, event, body);
    ctx_.directory().increment_message_count(channel_id);
}

} // namespace walkierelay::relay
