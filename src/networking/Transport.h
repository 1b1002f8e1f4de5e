#pragma once

#include <boost/json/value.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace walkierelay::networking {

using ConnectionId = std::string;

// What the relay core needs from the framed-message layer. Every call is
// made from the event thread; delivery is best-effort and per-connection
// ordered.
class Transport {
public:
    virtual ~Transport() = default;

    // Direct delivery of {"event": event, "data": payload}. Unknown ids are ignored.
    virtual void send(const ConnectionId& to, std::string_view event,
                      const boost::json::value& payload) = 0;

    // Every connection bound to `room`, minus `except` when given.
    virtual void broadcast(const std::string& room, const std::optional<ConnectionId>& except,
                           std::string_view event, const boost::json::value& payload) = 0;

    virtual void join_room(const ConnectionId& id, const std::string& room) = 0;
    virtual void leave_room(const ConnectionId& id, const std::string& room) = 0;

    virtual void stop_accepting() = 0;

    // Closes every connection once its queued writes are flushed, then
    // invokes `on_all_closed` on the event thread.
    virtual void close_all(std::function<void()> on_all_closed) = 0;
};

} // namespace walkierelay::networking
