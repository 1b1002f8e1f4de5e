#pragma once

#include "networking/Transport.h"

#include <cstdint>
#include <optional>
#include <string>

namespace walkierelay::relay {

using networking::ConnectionId;

struct Connection {
    ConnectionId connection_id;                  // "conn-<ulid>"
    std::optional<std::string> user_id;          // set on channel join
    std::optional<std::string> current_channel;

    std::int64_t connected_at_ms = 0;

    bool has_identity() const noexcept { return user_id.has_value(); }
};

} // namespace walkierelay::relay
