#pragma once

#include "relay/MediaRelay.h"
#include "relay/Payload.h"
#include "relay/PresenceBroadcaster.h"
#include "relay/RelayContext.h"
#include "relay/SignalingRouter.h"

#include <boost/json/object.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace walkierelay::relay {

// Entry point for transport callbacks. Decodes {"event", "data"} frames and
// routes them; malformed input gets an `error` reply, handler faults are
// logged and swallowed so one bad event never takes the server down.
class EventDispatcher {
public:
    EventDispatcher(RelayContext& ctx, PresenceBroadcaster& presence,
                    SignalingRouter& router, MediaRelay& media);

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void on_connect(const ConnectionId& id);
    void on_message(const ConnectionId& id, const std::string& frame);
    void on_disconnect(const ConnectionId& id);

    // Inbound events are dropped while the gate returns false (draining).
    void set_gate(std::function<bool()> accepting) { accepting_ = std::move(accepting); }

    std::uint64_t fault_count() const noexcept { return faults_; }

private:
    using Handler = std::function<void(const ConnectionId&, const boost::json::object&)>;

    void register_handlers();
    void dispatch(const ConnectionId& id, const std::string& event, const boost::json::object& data);
    void reject(const ConnectionId& id, ErrorCode code, std::string_view event, const std::string& message);

    RelayContext& ctx_;
    PresenceBroadcaster& presence_;
    SignalingRouter& router_;
    MediaRelay& media_;

    std::unordered_map<std::string, Handler> handlers_;
    std::function<bool()> accepting_;
    std::uint64_t faults_ = 0;
};

} // namespace walkierelay::relay
