#include "relay/EventDispatcher.h"

#include <boost/json.hpp>

#include <iostream>

namespace walkierelay::relay {

namespace json = boost::json;

EventDispatcher::EventDispatcher(RelayContext& ctx, PresenceBroadcaster& presence,
                                 SignalingRouter& router, MediaRelay& media)
    : ctx_(ctx), presence_(presence), router_(router), media_(media) {
    register_handlers();
}

void EventDispatcher::register_handlers() {
    handlers_["join-channel"] = [this](const ConnectionId& id, const json::object& data) {
        const std::string channel_id = require_string(data, "channelId");
        const std::string user_id = require_string(data, "userId");
        presence_.join(id, channel_id, user_id);
    };

    handlers_["leave-channel"] = [this](const ConnectionId& id, const json::object& data) {
        presence_.leave(id, require_string(data, "channelId"));
    };

    handlers_["get-channel-users"] = [this](const ConnectionId& id, const json::object& data) {
        json::array users;
        for (auto& u : presence_.channel_users(require_string(data, "channelId"))) {
            users.emplace_back(u);
        }
        ctx_.transport().send(id, "channel-users", users);
    };

    handlers_["ping"] = [this](const ConnectionId& id, const json::object&) {
        ctx_.transport().send(id, "pong", json::object{{"timestamp", ctx_.now_ms()}});
    };

    handlers_["transmission-start"] = [this](const ConnectionId& id, const json::object& data) {
        media_.transmission(id, "transmission-start", data);
    };
    handlers_["transmission-end"] = [this](const ConnectionId& id, const json::object& data) {
        media_.transmission(id, "transmission-end", data);
    };
    handlers_["audio-data"] = [this](const ConnectionId& id, const json::object& data) {
        media_.audio_data(id, data);
    };
    handlers_["audio-url"] = [this](const ConnectionId& id, const json::object& data) {
        media_.audio_url(id, data);
    };
    handlers_["audio-chunk"] = [this](const ConnectionId& id, const json::object& data) {
        media_.audio_chunk(id, data);
    };

    for (const char* event : {"webrtc-offer", "webrtc-answer", "webrtc-ice-candidate",
                              "ice-candidate", "request-webrtc-connection"}) {
        handlers_[event] = [this, event](const ConnectionId& id, const json::object& data) {
            router_.route(id, event, data);
        };
    }
}

void EventDispatcher::on_connect(const ConnectionId& id) {
    try {
        presence_.connect(id);
    } catch (const std::exception& e) {
        ++faults_;
        std::cerr << "[dispatch] connect " << id << " failed: " << e.what() << "\n";
    }
}

void EventDispatcher::on_disconnect(const ConnectionId& id) {
    try {
        presence_.disconnect(id);
    } catch (const std::exception& e) {
        ++faults_;
        std::cerr << "[dispatch] disconnect " << id << " failed: " << e.what() << "\n";
    }
}

void EventDispatcher::on_message(const ConnectionId& id, const std::string& frame) {
    if (accepting_ && !accepting_()) return;

    json::error_code ec;
    json::value v = json::parse(frame, ec);
    if (ec) {
        reject(id, ErrorCode::InvalidPayload, "", "invalid json");
        return;
    }

    const json::object* envelope = v.if_object();
    const json::value* event_value = envelope ? envelope->if_contains("event") : nullptr;
    if (!event_value || !event_value->is_string()) {
        reject(id, ErrorCode::InvalidPayload, "", "missing event");
        return;
    }
    const json::string& event_str = event_value->get_string();
    const std::string event(event_str.data(), event_str.size());

    static const json::object empty;
    const json::object* data = &empty;
    if (const json::value* d = envelope->if_contains("data"); d && !d->is_null()) {
        data = d->if_object();
        if (!data) {
            reject(id, ErrorCode::InvalidPayload, event, "data must be an object");
            return;
        }
    }

    dispatch(id, event, *data);
}

void EventDispatcher::dispatch(const ConnectionId& id, const std::string& event, const json::object& data) {
    auto it = handlers_.find(event);
    if (it == handlers_.end()) {
        reject(id, ErrorCode::UnknownEvent, event, "unknown event");
        return;
    }

    try {
        it->second(id, data);
    } catch (const RelayError& e) {
        reject(id, e.code(), event, e.what());
    } catch (const std::exception& e) {
        ++faults_;
        std::cerr << "[dispatch] fault in " << event << " from " << id << ": " << e.what() << "\n";
    }
}

void EventDispatcher::reject(const ConnectionId& id, ErrorCode code, std::string_view event,
                             const std::string& message) {
    json::object body;
    body["code"] = json::string_view(to_string(code).data(), to_string(code).size());
    body["event"] = json::string_view(event.data(), event.size());
    body["message"] = message;

    std::cout << "[dispatch] rejected " << (event.empty() ? "frame" : event) << " from " << id
              << ": " << to_string(code) << " (" << message << ")\n";
    ctx_.transport().send(id, "error", body);
}

} // namespace walkierelay::relay
