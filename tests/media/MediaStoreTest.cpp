#include <gtest/gtest.h>

#include "media/MediaStore.h"
#include "support/TempDir.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <fstream>

namespace walkierelay::media {
namespace test {

using walkierelay::test::TempDir;

class MediaStoreTest : public ::testing::Test {
protected:
    void write_file(const std::string& name, const std::string& bytes, std::chrono::seconds age) {
        const fs::path p = dir_.path() / name;
        std::ofstream(p, std::ios::binary) << bytes;
        fs::last_write_time(p, fs::file_time_type::clock::now() - age);
    }

    // Drains the pool, then delivers its completions on this thread.
    void settle() {
        pool_.join();
        ioc_.run();
    }

    TempDir dir_;
    boost::asio::io_context ioc_;
    boost::asio::thread_pool pool_{1};
    util::IDGenerator ids_;
    MediaStore store_{ioc_, pool_, dir_.path(), ids_};
};

TEST(MediaStoreNameTest, AcceptsOnlyPlainNames) {
    EXPECT_TRUE(MediaStore::is_safe_name("upload-01HZY.m4a"));
    EXPECT_TRUE(MediaStore::is_safe_name("clip.m4a"));

    EXPECT_FALSE(MediaStore::is_safe_name(""));
    EXPECT_FALSE(MediaStore::is_safe_name("."));
    EXPECT_FALSE(MediaStore::is_safe_name(".."));
    EXPECT_FALSE(MediaStore::is_safe_name("../etc/passwd"));
    EXPECT_FALSE(MediaStore::is_safe_name("a/b.m4a"));
    EXPECT_FALSE(MediaStore::is_safe_name("a\\b.m4a"));
    EXPECT_FALSE(MediaStore::is_safe_name("x..m4a"));
}

TEST_F(MediaStoreTest, EnsureDirectoryCreatesNestedPath) {
    MediaStore nested(ioc_, pool_, dir_.path() / "a" / "b", ids_);
    nested.ensure_directory();
    EXPECT_TRUE(fs::is_directory(dir_.path() / "a" / "b"));
}

TEST_F(MediaStoreTest, StoreThenReadBack) {
    const auto result = store_.store_blocking("clip.m4a", std::string("\x00\x01\x02", 3));
    ASSERT_TRUE(result.filename.has_value()) << result.error;
    EXPECT_EQ(*result.filename, "clip.m4a");

    const auto bytes = store_.read_blocking("clip.m4a");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(*bytes, std::string("\x00\x01\x02", 3));
}

TEST_F(MediaStoreTest, StoreRefusesUnsafeName) {
    const auto result = store_.store_blocking("../escape.m4a", "x");
    EXPECT_FALSE(result.filename.has_value());
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(fs::exists(dir_.path().parent_path() / "escape.m4a"));
}

TEST_F(MediaStoreTest, ReadMissingOrUnsafeGivesNothing) {
    EXPECT_FALSE(store_.read_blocking("missing.m4a").has_value());
    EXPECT_FALSE(store_.read_blocking("../missing.m4a").has_value());
}

TEST_F(MediaStoreTest, SweepRemovesOnlyFilesPastRetention) {
    write_file("old.m4a", "old", std::chrono::hours(2));
    write_file("fresh.m4a", "new", std::chrono::seconds(0));

    const auto result = store_.sweep_stale_blocking(std::chrono::hours(1), fs::file_time_type::clock::now());

    EXPECT_EQ(result.scanned, 2u);
    ASSERT_EQ(result.removed.size(), 1u);
    EXPECT_EQ(result.removed[0], "old.m4a");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_FALSE(fs::exists(dir_.path() / "old.m4a"));
    EXPECT_TRUE(fs::exists(dir_.path() / "fresh.m4a"));
}

TEST_F(MediaStoreTest, SweepSkipsSubdirectories) {
    fs::create_directory(dir_.path() / "nested");
    write_file("old.m4a", "old", std::chrono::hours(2));

    const auto result = store_.sweep_stale_blocking(std::chrono::hours(1), fs::file_time_type::clock::now());

    EXPECT_EQ(result.scanned, 1u);
    EXPECT_TRUE(fs::is_directory(dir_.path() / "nested"));
}

TEST_F(MediaStoreTest, SweepOfMissingDirectoryReportsError) {
    MediaStore missing(ioc_, pool_, dir_.path() / "does-not-exist", ids_);
    const auto result = missing.sweep_stale_blocking(std::chrono::hours(1), fs::file_time_type::clock::now());

    EXPECT_EQ(result.scanned, 0u);
    EXPECT_EQ(result.errors.size(), 1u);
}

TEST_F(MediaStoreTest, PurgeRemovesEveryFile) {
    write_file("a.m4a", "a", std::chrono::seconds(0));
    write_file("b.m4a", "b", std::chrono::seconds(0));

    EXPECT_EQ(store_.purge_blocking(), 2u);
    EXPECT_TRUE(fs::is_empty(dir_.path()));
}

TEST_F(MediaStoreTest, AsyncStoreCompletesOnEventThread) {
    std::optional<StoreResult> got;
    store_.store("audio-bytes", [&](StoreResult r) { got = std::move(r); });
    settle();

    ASSERT_TRUE(got.has_value());
    ASSERT_TRUE(got->filename.has_value()) << got->error;
    EXPECT_EQ(got->filename->rfind("upload-", 0), 0u);
    EXPECT_EQ(got->filename->size(), std::string("upload-").size() + 26 + std::string(".m4a").size());
    EXPECT_EQ(store_.read_blocking(*got->filename), std::optional<std::string>("audio-bytes"));
}

TEST_F(MediaStoreTest, AsyncReadOfMissingFile) {
    bool called = false;
    std::optional<std::string> got = std::string("sentinel");
    store_.read("missing.m4a", [&](std::optional<std::string> r) {
        called = true;
        got = std::move(r);
    });
    settle();

    EXPECT_TRUE(called);
    EXPECT_FALSE(got.has_value());
}

} // namespace test
} // namespace walkierelay::media
