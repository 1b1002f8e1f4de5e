#pragma once

#include "relay/Connection.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace walkierelay::relay {

// Owns every live Connection record. `by_user_` is a secondary index kept in
// lock-step with `connections_` so identity lookups stay O(1).
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Throws std::invalid_argument if `id` is already registered.
    Connection& register_connection(const ConnectionId& id, std::int64_t now_ms);

    Connection* lookup(const ConnectionId& id);
    const Connection* lookup(const ConnectionId& id) const;

    // With several connections sharing a user id the lowest connection id
    // wins; callers must not rely on which one.
    const Connection* lookup_by_user_id(const std::string& user_id) const;

    // Returns false for an unknown connection.
    bool set_identity(const ConnectionId& id, const std::string& user_id);
    bool set_channel(const ConnectionId& id, std::optional<std::string> channel_id);

    // Channel cleanup must already have happened.
    bool remove(const ConnectionId& id);

    std::size_t size() const noexcept { return connections_.size(); }
    std::vector<ConnectionId> connection_ids() const;

private:
    void unindex(const Connection& conn);

    std::unordered_map<ConnectionId, Connection> connections_;
    std::unordered_map<std::string, std::set<ConnectionId>> by_user_;
};

} // namespace walkierelay::relay
