#include "relay/PresenceBroadcaster.h"

#include <boost/json.hpp>

#include <iostream>
#include <optional>

namespace walkierelay::relay {

namespace json = boost::json;

namespace {

json::array to_json(const std::vector<std::string>& users) {
    json::array arr;
    arr.reserve(users.size());
    for (const auto& u : users) arr.emplace_back(u);
    return arr;
}

} // namespace

void PresenceBroadcaster::connect(const ConnectionId& id) {
    const auto now = ctx_.now_ms();
    ctx_.registry().register_connection(id, now);

    std::cout << "[presence] connected " << id << "\n";
    ctx_.transport().send(id, "connected", json::object{
        {"socketId", id},
        {"timestamp", now}
    });
}

void PresenceBroadcaster::join(const ConnectionId& id, const std::string& channel_id,
                               const std::string& user_id) {
    Connection* conn = ctx_.registry().lookup(id);
    if (!conn) {
        std::cerr << "[presence] join from unknown connection " << id << "\n";
        return;
    }

    if (conn->current_channel && *conn->current_channel != channel_id) {
        const std::string previous = *conn->current_channel;
        depart(id, previous);
        ctx_.registry().set_channel(id, std::nullopt);
    }

    auto& directory = ctx_.directory();
    directory.get_or_create(channel_id, ctx_.now_ms());
    const bool added = directory.add_member(channel_id, id, user_id, ctx_.now_ms());
    std::optional<std::string> renamed_from;
    if (!added) renamed_from = directory.rename_member(channel_id, id, user_id);

    ctx_.registry().set_identity(id, user_id);
    ctx_.registry().set_channel(id, channel_id);

    auto& transport = ctx_.transport();
    transport.join_room(id, channel_id);

    // Snapshot goes out before the broadcast so the joiner never sees a
    // user-joined for someone missing from its list.
    transport.send(id, "channel-users", to_json(directory.list_members(channel_id, id)));

    if (added) {
        transport.broadcast(channel_id, id, "user-joined", json::value(user_id));
        std::cout << "[presence] " << user_id << " joined " << channel_id
                  << " (" << directory.find(channel_id)->members.size() << " members)\n";
    } else if (renamed_from) {
        // Same connection under a new name: the others drop the old entry.
        transport.broadcast(channel_id, id, "user-left", json::value(*renamed_from));
        transport.broadcast(channel_id, id, "user-joined", json::value(user_id));
        std::cout << "[presence] " << *renamed_from << " is now " << user_id << " in " << channel_id << "\n";
    }
}

void PresenceBroadcaster::leave(const ConnectionId& id, const std::string& channel_id) {
    if (!depart(id, channel_id)) return;

    Connection* conn = ctx_.registry().lookup(id);
    if (conn && conn->current_channel == channel_id) {
        ctx_.registry().set_channel(id, std::nullopt);
    }
}

void PresenceBroadcaster::disconnect(const ConnectionId& id) {
    const Connection* conn = ctx_.registry().lookup(id);
    if (!conn) return;

    if (conn->current_channel) {
        const std::string channel_id = *conn->current_channel;
        depart(id, channel_id);
    }
    ctx_.registry().remove(id);
    std::cout << "[presence] disconnected " << id << "\n";
}

std::vector<std::string> PresenceBroadcaster::channel_users(const std::string& channel_id) const {
    return ctx_.directory().list_members(channel_id);
}

bool PresenceBroadcaster::depart(const ConnectionId& id, const std::string& channel_id) {
    std::size_t remaining = 0;
    auto removed = ctx_.directory().remove_member(channel_id, id, &remaining);
    if (!removed) return false;

    auto& transport = ctx_.transport();
    transport.leave_room(id, channel_id);
    transport.broadcast(channel_id, id, "user-left", json::value(removed->user_id));

    std::cout << "[presence] " << removed->user_id << " left " << channel_id << "\n";
    if (remaining == 0) {
        std::cout << "[presence] channel " << channel_id << " deleted (empty)\n";
    }
    return true;
}

} // namespace walkierelay::relay
