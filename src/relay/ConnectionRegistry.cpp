#include "relay/ConnectionRegistry.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace walkierelay::relay {

Connection& ConnectionRegistry::register_connection(const ConnectionId& id, std::int64_t now_ms) {
    auto [it, inserted] = connections_.try_emplace(id);
    if (!inserted) {
        throw std::invalid_argument("connection already registered: " + id);
    }
    it->second.connection_id = id;
    it->second.connected_at_ms = now_ms;
    return it->second;
}

Connection* ConnectionRegistry::lookup(const ConnectionId& id) {
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : &it->second;
}

const Connection* ConnectionRegistry::lookup(const ConnectionId& id) const {
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : &it->second;
}

const Connection* ConnectionRegistry::lookup_by_user_id(const std::string& user_id) const {
    auto it = by_user_.find(user_id);
    if (it == by_user_.end() || it->second.empty()) return nullptr;
    return lookup(*it->second.begin());
}

bool ConnectionRegistry::set_identity(const ConnectionId& id, const std::string& user_id) {
    Connection* conn = lookup(id);
    if (!conn) return false;
    if (conn->user_id == user_id) return true;

    unindex(*conn);
    conn->user_id = user_id;
    by_user_[user_id].insert(id);
    return true;
}

bool ConnectionRegistry::set_channel(const ConnectionId& id, std::optional<std::string> channel_id) {
    Connection* conn = lookup(id);
    if (!conn) return false;
    conn->current_channel = std::move(channel_id);
    return true;
}

bool ConnectionRegistry::remove(const ConnectionId& id) {
    auto it = connections_.find(id);
    if (it == connections_.end()) return false;
    unindex(it->second);
    connections_.erase(it);
    return true;
}

std::vector<ConnectionId> ConnectionRegistry::connection_ids() const {
    std::vector<ConnectionId> ids;
    ids.reserve(connections_.size());
    for (const auto& [id, conn] : connections_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

void ConnectionRegistry::unindex(const Connection& conn) {
    if (!conn.user_id) return;
    auto it = by_user_.find(*conn.user_id);
    if (it == by_user_.end()) return;
    it->second.erase(conn.connection_id);
    if (it->second.empty()) by_user_.erase(it);
}

} // namespace walkierelay::relay
