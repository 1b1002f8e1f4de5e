#pragma once

#include "util/IDGenerator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace walkierelay::media {

namespace fs = std::filesystem;

struct SweepResult {
    std::size_t scanned = 0;
    std::vector<std::string> removed;
    std::vector<std::string> errors;  // per-file failures, already skipped
};

struct StoreResult {
    std::optional<std::string> filename;
    std::string error;
};

// Directory of uploaded clips. The *_blocking calls touch the disk directly;
// the asynchronous wrappers run them on the blocking pool and hand the result
// back on the event thread.
class MediaStore {
public:
    MediaStore(boost::asio::io_context& ioc, boost::asio::thread_pool& pool,
               fs::path directory, util::IDGenerator& ids);

    MediaStore(const MediaStore&) = delete;
    MediaStore& operator=(const MediaStore&) = delete;

    // Throws fs::filesystem_error when the directory cannot be created.
    void ensure_directory() const;

    const fs::path& directory() const noexcept { return dir_; }

    // Plain file names only: no separators, no "..", not empty.
    static bool is_safe_name(std::string_view name) noexcept;

    SweepResult sweep_stale_blocking(std::chrono::seconds retention, fs::file_time_type now) const;
    std::size_t purge_blocking() const;
    StoreResult store_blocking(const std::string& filename, const std::string& bytes) const;
    std::optional<std::string> read_blocking(const std::string& filename) const;

    void sweep_stale(std::chrono::seconds retention, std::function<void(SweepResult)> done);
    void purge(std::function<void(std::size_t)> done);
    void store(std::string bytes, std::function<void(StoreResult)> done);
    void read(std::string filename, std::function<void(std::optional<std::string>)> done);

private:
    template <class Work, class Done>
    void offload(Work work, Done done) {
        boost::asio::post(pool_, [this, work = std::move(work), done = std::move(done)]() mutable {
            auto result = work();
            boost::asio::post(ioc_, [done = std::move(done), result = std::move(result)]() mutable {
                done(std::move(result));
            });
        });
    }

    boost::asio::io_context& ioc_;
    boost::asio::thread_pool& pool_;
    fs::path dir_;
    util::IDGenerator& ids_;
};

} // namespace walkierelay::media
