#pragma once

#include "relay/RelayContext.h"

#include <boost/json/object.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace walkierelay::relay {

// Every other member of the channel.
struct BroadcastTo {
    std::string channel_id;
};

// Exactly one connection. Without a scope the identity is looked up across
// all connections, which can cross channel boundaries.
struct DirectTo {
    std::string user_id;
    std::optional<std::string> channel_scope;
};

using Destination = std::variant<BroadcastTo, DirectTo>;

enum class SignalKind { Offer, Answer, IceCandidate, ConnectionRequest };

// Inbound event name -> kind; std::nullopt for anything else.
std::optional<SignalKind> signal_kind_of(std::string_view event) noexcept;

// Relays negotiation payloads without looking inside them. Unresolvable
// destinations are dropped with a log line, never reported to the sender.
class SignalingRouter {
public:
    SignalingRouter(RelayContext& ctx, bool allow_cross_channel)
        : ctx_(ctx), allow_cross_channel_(allow_cross_channel) {}

    // Full handling of one inbound signaling event. Returns the number of
    // recipients the payload was handed to. Throws RelayError for malformed
    // input or a sender without identity.
    std::size_t route(const ConnectionId& from, std::string_view event, const boost::json::object& data);

    // Decodes either addressing scheme. Empty when a `to` address cannot be
    // scoped because cross-channel delivery is off and the sender is in no
    // channel.
    std::optional<Destination> destination_for(const Connection& sender,
                                               const boost::json::object& data,
                                               bool target_required) const;

    std::optional<ConnectionId> resolve(const DirectTo& dest) const;

    std::size_t deliver(const ConnectionId& from, const Destination& dest,
                        std::string_view event, const boost::json::value& body);

    bool allows_cross_channel() const noexcept { return allow_cross_channel_; }

private:
    RelayContext& ctx_;
    bool allow_cross_channel_;
};

} // namespace walkierelay::relay
