#include "relay/Janitor.h"

#include <iostream>

namespace walkierelay::relay {

Janitor::Janitor(boost::asio::io_context& ioc, RelayContext& ctx, media::MediaStore* store,
                 const JanitorSettings& settings)
    : ctx_(ctx),
      store_(store),
      settings_(settings),
      channel_sweep_(ioc, "channel-sweep", settings.channel_sweep_interval, [this] { sweep_empty_channels(); }),
      media_sweep_(ioc, "media-sweep", settings.media_sweep_interval, [this] { sweep_stale_media(); }),
      stats_(ioc, "stats", settings.stats_interval, [this] { log_stats(); }) {}

void Janitor::start() {
    channel_sweep_.start();
    if (store_) media_sweep_.start();
    stats_.start();
}

void Janitor::stop() {
    channel_sweep_.cancel();
    media_sweep_.cancel();
    stats_.cancel();
}

std::size_t Janitor::sweep_empty_channels() {
    const std::size_t cleaned = ctx_.directory().sweep_empty();
    if (cleaned > 0) {
        std::cout << "[janitor] cleaned " << cleaned << " empty channel(s)\n";
    }
    return cleaned;
}

void Janitor::sweep_stale_media() {
    if (!store_) return;
    store_->sweep_stale(settings_.media_retention, [](media::SweepResult result) {
        for (const auto& name : result.removed) {
            std::cout << "[janitor] deleted old audio file: " << name << "\n";
        }
        for (const auto& err : result.errors) {
            std::cerr << "[janitor] skipped: " << err << "\n";
        }
    });
}

RelayStats Janitor::collect_stats() const {
    RelayStats s;
    s.channels = ctx_.directory().size();
    s.connections = ctx_.registry().size();
    s.relayed_messages = ctx_.directory().total_message_count();
    return s;
}

void Janitor::log_stats() const {
    const RelayStats s = collect_stats();
    std::cout << "[stats] channels: " << s.channels
              << ", connections: " << s.connections
              << ", relayed messages: " << s.relayed_messages << "\n";
}

} // namespace walkierelay::relay
