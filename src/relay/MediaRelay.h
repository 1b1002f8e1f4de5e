#pragma once

#include "relay/RelayContext.h"

#include <boost/json/object.hpp>

#include <string>
#include <string_view>

namespace walkierelay::relay {

// Pure fan-out of push-to-talk state and audio to the rest of a channel. No
// buffering, reordering or acknowledgement; each relayed event bumps the
// channel's message counter.
class MediaRelay {
public:
    explicit MediaRelay(RelayContext& ctx) : ctx_(ctx) {}

    // transmission-start / transmission-end
    void transmission(const ConnectionId& from, std::string_view event, const boost::json::object& data);

    // audio-data -> audio-received
    void audio_data(const ConnectionId& from, const boost::json::object& data);

    // audio-url -> audio-message
    void audio_url(const ConnectionId& from, const boost::json::object& data);

    // audio-chunk; the sender's identity is attached server-side.
    void audio_chunk(const ConnectionId& from, const boost::json::object& data);

    // Bridge for clips stored over HTTP: every member hears about it,
    // including the uploader's own connection.
    void announce_upload(const std::string& channel_id, const std::string& user_id,
                         const std::string& audio_url);

private:
    void fan_out(const ConnectionId& from, const std::string& channel_id,
                 std::string_view event, const boost::json::object& body);

    RelayContext& ctx_;
};

} // namespace walkierelay::relay
