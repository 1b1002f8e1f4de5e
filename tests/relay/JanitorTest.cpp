#include <gtest/gtest.h>

#include "relay/Janitor.h"
#include "support/RelayFixture.h"
#include "support/TempDir.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <fstream>

namespace walkierelay::relay {
namespace test {

namespace fs = std::filesystem;
using walkierelay::test::RelayFixture;
using walkierelay::test::TempDir;

class JanitorTest : public RelayFixture {
protected:
    boost::asio::io_context ioc_;
};

TEST_F(JanitorTest, SweepsChannelsLeftWithoutMembers) {
    connect_and_join("conn-a", "room1", "userA");
    ctx.directory().get_or_create("orphan", clock_ms);

    Janitor janitor(ioc_, ctx, nullptr, JanitorSettings{});

    EXPECT_EQ(janitor.sweep_empty_channels(), 1u);
    EXPECT_EQ(ctx.directory().find("orphan"), nullptr);
    EXPECT_NE(ctx.directory().find("room1"), nullptr);
    EXPECT_EQ(janitor.sweep_empty_channels(), 0u);
}

TEST_F(JanitorTest, StatsReflectCurrentState) {
    connect_and_join("conn-a", "room1", "userA");
    connect_and_join("conn-b", "room1", "userB");
    connect("conn-c");
    ctx.directory().increment_message_count("room1");
    ctx.directory().increment_message_count("room1");

    Janitor janitor(ioc_, ctx, nullptr, JanitorSettings{});
    const RelayStats stats = janitor.collect_stats();

    EXPECT_EQ(stats.channels, 1u);
    EXPECT_EQ(stats.connections, 3u);
    EXPECT_EQ(stats.relayed_messages, 2u);
}

TEST_F(JanitorTest, StartAndStop) {
    Janitor janitor(ioc_, ctx, nullptr, JanitorSettings{});

    janitor.start();
    EXPECT_TRUE(janitor.running());

    janitor.stop();
    EXPECT_FALSE(janitor.running());

    // Cancelled timers complete immediately, so the loop has nothing left.
    ioc_.run();
    EXPECT_EQ(ctx.directory().size(), 0u);
}

TEST_F(JanitorTest, EachSweepLogsUnderItsOwnName) {
    Janitor janitor(ioc_, ctx, nullptr, JanitorSettings{});

    EXPECT_EQ(janitor.channel_sweep_task().name(), "channel-sweep");
    EXPECT_EQ(janitor.media_sweep_task().name(), "media-sweep");
    EXPECT_EQ(janitor.stats_task().name(), "stats");
}

TEST_F(JanitorTest, StaleMediaSweepDeletesExpiredClips) {
    TempDir dir;
    boost::asio::thread_pool pool(1);
    util::IDGenerator ids;
    media::MediaStore store(ioc_, pool, dir.path(), ids);

    const fs::path old_clip = dir.path() / "upload-old.m4a";
    const fs::path new_clip = dir.path() / "upload-new.m4a";
    std::ofstream(old_clip, std::ios::binary) << "old";
    std::ofstream(new_clip, std::ios::binary) << "new";
    fs::last_write_time(old_clip, fs::file_time_type::clock::now() - std::chrono::hours(2));

    JanitorSettings settings;
    settings.media_retention = std::chrono::hours(1);
    Janitor janitor(ioc_, ctx, &store, settings);

    janitor.sweep_stale_media();
    pool.join();
    ioc_.run();

    EXPECT_FALSE(fs::exists(old_clip));
    EXPECT_TRUE(fs::exists(new_clip));
}

TEST_F(JanitorTest, MediaSweepWithoutStoreIsNoOp) {
    Janitor janitor(ioc_, ctx, nullptr, JanitorSettings{});
    janitor.sweep_stale_media();
    EXPECT_EQ(ioc_.poll(), 0u);
}

} // namespace test
} // namespace walkierelay::relay
