#pragma once

#include "media/MediaStore.h"
#include "relay/PeriodicTask.h"
#include "relay/RelayContext.h"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace walkierelay::relay {

struct JanitorSettings {
    std::chrono::seconds channel_sweep_interval{60};
    std::chrono::seconds media_sweep_interval{300};
    std::chrono::seconds media_retention{3600};
    std::chrono::seconds stats_interval{300};
};

struct RelayStats {
    std::size_t channels = 0;
    std::size_t connections = 0;
    std::uint64_t relayed_messages = 0;
};

// Background sweeps that keep derived state tidy. Each sweep is also callable
// directly so it can be run on demand or from tests.
class Janitor {
public:
    // `store` may be null, which disables the stale-media sweep.
    Janitor(boost::asio::io_context& ioc, RelayContext& ctx, media::MediaStore* store,
            const JanitorSettings& settings);

    void start();
    void stop();
    bool running() const noexcept { return channel_sweep_.running(); }

    // Deletes channels left without members; returns how many.
    std::size_t sweep_empty_channels();

    // Asynchronous; per-file failures are logged and skipped.
    void sweep_stale_media();

    RelayStats collect_stats() const;

    const PeriodicTask& channel_sweep_task() const noexcept { return channel_sweep_; }
    const PeriodicTask& media_sweep_task() const noexcept { return media_sweep_; }
    const PeriodicTask& stats_task() const noexcept { return stats_; }

private:
    void log_stats() const;

    RelayContext& ctx_;
    media::MediaStore* store_;
    JanitorSettings settings_;

    PeriodicTask channel_sweep_;
    PeriodicTask media_sweep_;
    PeriodicTask stats_;
};

} // namespace walkierelay::relay
