#pragma once

#include "networking/Transport.h"
#include "relay/ChannelDirectory.h"
#include "relay/ConnectionRegistry.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

namespace walkierelay::relay {

using NowFn = std::function<std::int64_t()>;

inline std::int64_t system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// The relay's state: both directories plus the transport they fan out through.
// One instance per server; tests build as many as they like.
class RelayContext {
public:
    explicit RelayContext(networking::Transport& transport, NowFn now = system_now_ms)
        : transport_(transport), now_(std::move(now)) {}

    RelayContext(const RelayContext&) = delete;
    RelayContext& operator=(const RelayContext&) = delete;

    ConnectionRegistry& registry() noexcept { return registry_; }
    const ConnectionRegistry& registry() const noexcept { return registry_; }

    ChannelDirectory& directory() noexcept { return directory_; }
    const ChannelDirectory& directory() const noexcept { return directory_; }

    networking::Transport& transport() noexcept { return transport_; }

    std::int64_t now_ms() const { return now_(); }

private:
    ConnectionRegistry registry_;
    ChannelDirectory directory_;
    networking::Transport& transport_;
    NowFn now_;
};

} // namespace walkierelay::relay
