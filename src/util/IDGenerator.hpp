#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace walkierelay::util {

// ULID uses Crockford's Base32 (no I, L, O, U) => 26 chars for 128 bits.
class IDGenerator {
public:
    enum class Kind { Connection, Upload };

    IDGenerator()
        : rng_(seed_engine_()) {}

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + ulid_string_();
    }

    std::string connectionID() { return make(Kind::Connection); }

    // Stored clip names: "upload-<ulid>.m4a"; ULIDs sort by creation time.
    std::string uploadName() { return make(Kind::Upload) + ".m4a"; }

private:
    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Connection: return "conn";
            case Kind::Upload:     return "upload";
        }
        return "id";
    }

    // --- ULID generation (monotonic within same millisecond) ---
    std::string ulid_string_() {
        std::array<std::uint8_t, 16> bytes{};

        const std::uint64_t ts_ms = now_ms_();

        // 48-bit timestamp, big-endian, bytes[0..5]
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts_ms >> (40 - 8 * i)) & 0xFF);
        }

        {
            std::lock_guard<std::mutex> lk(mu_);

            if (ts_ms != last_ts_ms_) {
                fill_random_80_(bytes);
                last_ts_ms_ = ts_ms;
                last_rand_ = extract_rand_80_(bytes);
            } else {
                // same millisecond => increment the previous 80-bit number
                ++last_rand_;
                write_rand_80_(bytes, last_rand_);
            }
        }

        return crockford_base32_encode_(bytes);
    }

    static std::uint64_t now_ms_() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    using u128 = unsigned __int128;

    void fill_random_80_(std::array<std::uint8_t, 16>& bytes) {
        std::uint64_t a = dist64_(rng_);
        std::uint64_t b = dist64_(rng_);

        for (int i = 0; i < 8; ++i) {
            bytes[static_cast<std::size_t>(6 + i)] =
                static_cast<std::uint8_t>((a >> (56 - 8 * i)) & 0xFF);
        }
        bytes[14] = static_cast<std::uint8_t>((b >> 56) & 0xFF);
        bytes[15] = static_cast<std::uint8_t>((b >> 48) & 0xFF);
    }

    static u128 extract_rand_80_(const std::array<std::uint8_t, 16>& bytes) {
        u128 x = 0;
        for (std::size_t i = 6; i < bytes.size(); ++i) {
            x = (x << 8) | bytes[i];
        }
        return x;
    }

    static void write_rand_80_(std::array<std::uint8_t, 16>& bytes, u128 rand80) {
        for (std::size_t i = bytes.size(); i-- > 6;) {
            bytes[i] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
    }

    // 128 bits -> 26 chars. The encoded value is left-padded with two zero
    // bits so the first char carries the top 3 bits of the timestamp.
    static std::string crockford_base32_encode_(const std::array<std::uint8_t, 16>& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::string out;
        out.reserve(26);

        std::uint32_t buffer = 0;
        int bits_in_buffer = 2;

        for (std::uint8_t byte : bytes) {
            buffer = (buffer << 8) | byte;
            bits_in_buffer += 8;

            while (bits_in_buffer >= 5) {
                bits_in_buffer -= 5;
                out.push_back(alphabet[(buffer >> bits_in_buffer) & 0x1F]);
            }
            buffer &= (1u << bits_in_buffer) - 1u;
        }

        return out;
    }

    static std::mt19937_64 seed_engine_() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count()),
            static_cast<unsigned>(reinterpret_cast<std::uintptr_t>(&rd))
        };
        return std::mt19937_64(seq);
    }

private:
    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist64_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ms_ = 0;
    u128 last_rand_ = 0;
};

} // namespace walkierelay::util
