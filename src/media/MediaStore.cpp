#include "media/MediaStore.h"

#include <fstream>
#include <iterator>
#include <system_error>

namespace walkierelay::media {

MediaStore::MediaStore(boost::asio::io_context& ioc, boost::asio::thread_pool& pool,
                       fs::path directory, util::IDGenerator& ids)
    : ioc_(ioc), pool_(pool), dir_(std::move(directory)), ids_(ids) {}

void MediaStore::ensure_directory() const {
    fs::create_directories(dir_);
}

bool MediaStore::is_safe_name(std::string_view name) noexcept {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string_view::npos) return false;
    if (name.find('\\') != std::string_view::npos) return false;
    if (name.find("..") != std::string_view::npos) return false;
    return true;
}

SweepResult MediaStore::sweep_stale_blocking(std::chrono::seconds retention, fs::file_time_type now) const {
    SweepResult result;

    std::error_code ec;
    fs::directory_iterator it(dir_, ec);
    if (ec) {
        result.errors.push_back(dir_.string() + ": " + ec.message());
        return result;
    }

    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            result.errors.push_back(dir_.string() + ": " + ec.message());
            break;
        }

        const fs::path path = it->path();
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        ++result.scanned;

        const auto mtime = fs::last_write_time(path, fec);
        if (fec) {
            result.errors.push_back("stat " + path.filename().string() + ": " + fec.message());
            continue;
        }
        if (now - mtime <= retention) continue;

        if (!fs::remove(path, fec) || fec) {
            result.errors.push_back("unlink " + path.filename().string() + ": " +
                                    (fec ? fec.message() : std::string("already gone")));
            continue;
        }
        result.removed.push_back(path.filename().string());
    }
    return result;
}

std::size_t MediaStore::purge_blocking() const {
    std::size_t removed = 0;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && fs::remove(it->path(), fec)) ++removed;
    }
    return removed;
}

StoreResult MediaStore::store_blocking(const std::string& filename, const std::string& bytes) const {
    StoreResult result;
    if (!is_safe_name(filename)) {
        result.error = "invalid file name";
        return result;
    }

    const fs::path path = dir_ / filename;
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        result.error = "cannot open " + path.string();
        return result;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        std::error_code ec;
        fs::remove(path, ec);
        result.error = "write failed for " + path.string();
        return result;
    }

    result.filename = filename;
    return result;
}

std::optional<std::string> MediaStore::read_blocking(const std::string& filename) const {
    if (!is_safe_name(filename)) return std::nullopt;

    std::ifstream in(dir_ / filename, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void MediaStore::sweep_stale(std::chrono::seconds retention, std::function<void(SweepResult)> done) {
    offload([this, retention] { return sweep_stale_blocking(retention, fs::file_time_type::clock::now()); },
            std::move(done));
}

void MediaStore::purge(std::function<void(std::size_t)> done) {
    offload([this] { return purge_blocking(); }, std::move(done));
}

void MediaStore::store(std::string bytes, std::function<void(StoreResult)> done) {
    offload([this, name = ids_.uploadName(), bytes = std::move(bytes)] { return store_blocking(name, bytes); },
            std::move(done));
}

void MediaStore::read(std::string filename, std::function<void(std::optional<std::string>)> done) {
    offload([this, filename = std::move(filename)] { return read_blocking(filename); }, std::move(done));
}

} // namespace walkierelay::media
