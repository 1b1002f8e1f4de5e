#pragma once

#include "relay/RelayContext.h"

#include <string>
#include <vector>

namespace walkierelay::relay {

// Join/leave bookkeeping plus the notifications that describe it.
class PresenceBroadcaster {
public:
    explicit PresenceBroadcaster(RelayContext& ctx) : ctx_(ctx) {}

    // Registers the connection and greets it with `connected`.
    void connect(const ConnectionId& id);

    // A connection in another channel leaves that one first. Rejoining the
    // current channel re-sends the snapshot; under a new userId the others
    // also get user-left for the old name and user-joined for the new one.
    void join(const ConnectionId& id, const std::string& channel_id, const std::string& user_id);

    // No-op unless `id` is a member of `channel_id`.
    void leave(const ConnectionId& id, const std::string& channel_id);

    // Implicit leave + registry removal. Idempotent.
    void disconnect(const ConnectionId& id);

    std::vector<std::string> channel_users(const std::string& channel_id) const;

private:
    // Removes the membership and tells the rest; returns false if there was none.
    bool depart(const ConnectionId& id, const std::string& channel_id);

    RelayContext& ctx_;
};

} // namespace walkierelay::relay
