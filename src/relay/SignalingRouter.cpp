#include "relay/SignalingRouter.h"
#include "relay/Payload.h"

#include <boost/json.hpp>

#include <iostream>
#include <type_traits>

namespace walkierelay::relay {

namespace json = boost::json;

std::optional<SignalKind> signal_kind_of(std::string_view event) noexcept {
    if (event == "webrtc-offer") return SignalKind::Offer;
    if (event == "webrtc-answer") return SignalKind::Answer;
    if (event == "webrtc-ice-candidate" || event == "ice-candidate") return SignalKind::IceCandidate;
    if (event == "request-webrtc-connection") return SignalKind::ConnectionRequest;
    return std::nullopt;
}

std::size_t SignalingRouter::route(const ConnectionId& from, std::string_view event,
                                   const json::object& data) {
    const auto kind = signal_kind_of(event);
    if (!kind) {
        throw RelayError(ErrorCode::UnknownEvent, "not a signaling event: " + std::string(event));
    }

    const Connection* sender = ctx_.registry().lookup(from);
    if (!sender) {
        std::cerr << "[signal] " << event << " from unknown connection " << from << "\n";
        return 0;
    }
    const std::string user_id = sender_identity(sender, data);

    json::object body;
    body["userId"] = user_id;

    std::string out_event;
    switch (*kind) {
        case SignalKind::Offer:
            body["offer"] = require_field(data, "offer");
            out_event = "webrtc-offer";
            break;
        case SignalKind::Answer:
            body["answer"] = require_field(data, "answer");
            out_event = "webrtc-answer";
            break;
        case SignalKind::IceCandidate:
            body["candidate"] = require_field(data, "candidate");
            out_event = std::string(event);
            break;
        case SignalKind::ConnectionRequest:
            out_event = "webrtc-connection-request";
            break;
    }

    const bool target_required = *kind == SignalKind::Answer || *kind == SignalKind::ConnectionRequest;
    const auto dest = destination_for(*sender, data, target_required);
    if (!dest) {
        std::cout << "[signal] dropped " << event << " from " << user_id
                  << ": not in a channel and cross-channel delivery is off\n";
        return 0;
    }
    if (optional_field(data, "to")) body["from"] = user_id;

    const std::size_t delivered = deliver(from, *dest, out_event, body);
    if (delivered == 0) {
        std::cout << "[signal] dropped " << event << " from " << user_id << ": no recipient\n";
    } else {
        std::cout << "[signal] " << event << " from " << user_id << " -> " << delivered << " recipient(s)\n";
    }
    return delivered;
}

std::optional<Destination> SignalingRouter::destination_for(const Connection& sender,
                                                            const json::object& data,
                                                            bool target_required) const {
    if (auto to = optional_string(data, "to")) {
        if (allow_cross_channel_) return Destination{DirectTo{*to, std::nullopt}};
        if (!sender.current_channel) return std::nullopt;
        return Destination{DirectTo{*to, *sender.current_channel}};
    }

    std::string channel_id = require_string(data, "channelId");
    if (auto target = optional_string(data, "targetUserId")) {
        return Destination{DirectTo{*target, std::move(channel_id)}};
    }
    if (target_required) {
        throw RelayError(ErrorCode::InvalidPayload, "missing targetUserId");
    }
    return Destination{BroadcastTo{std::move(channel_id)}};
}

std::optional<ConnectionId> SignalingRouter::resolve(const DirectTo& dest) const {
    if (dest.channel_scope) {
        auto member = ctx_.directory().find_member_by_user_id(*dest.channel_scope, dest.user_id);
        if (!member) return std::nullopt;
        return member->connection_id;
    }
    const Connection* conn = ctx_.registry().lookup_by_user_id(dest.user_id);
    if (!conn) return std::nullopt;
    return conn->connection_id;
}

std::size_t SignalingRouter::deliver(const ConnectionId& from, const Destination& dest,
                                     std::string_view event, const json::value& body) {
    return std::visit([&](const auto& d) -> std::size_t {
        using T = std::decay_t<decltype(d)>;
        if constexpr (std::is_same_v<T, BroadcastTo>) {
            const std::size_t recipients = ctx_.directory().list_members(d.channel_id, from).size();
            if (recipients > 0) ctx_.transport().broadcast(d.channel_id, from, event, body);
            return recipients;
        } else {
            auto target = resolve(d);
            if (!target) return 0;
            ctx_.transport().send(*target, event, body);
            return 1;
        }
    }, dest);
}

} // namespace walkierelay::relay
