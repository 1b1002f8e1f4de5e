#pragma once

#include "relay/Janitor.h"

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

namespace walkierelay::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 3000;
    std::string audio_dir = "./audio_temp";
    std::size_t max_upload_bytes = 10 * 1024 * 1024;
    std::chrono::seconds channel_sweep_interval{60};
    std::chrono::seconds media_sweep_interval{300};
    std::chrono::seconds media_retention{3600};
    std::chrono::seconds stats_interval{300};
    std::chrono::seconds shutdown_deadline{10};
    bool allow_cross_channel_signaling = false;
    std::size_t blocking_threads = 2;

    relay::JanitorSettings janitor_settings() const;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Command line, then PORT / WALKIE_* from the environment, then defaults.
// Returns std::nullopt after printing usage for --help. Throws ConfigError for
// unknown options, malformed values or values out of range.
std::optional<ServerConfig> load_config(int argc, const char* const argv[], std::ostream& out);

// PORT -> "port", WALKIE_AUDIO_DIR -> "audio-dir"; "" for unrelated variables.
std::string environment_option_name(const std::string& variable);

} // namespace walkierelay::config
