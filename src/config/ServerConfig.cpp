#include "config/ServerConfig.h"

#include <boost/program_options.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace walkierelay::config {

namespace po = boost::program_options;

namespace {

constexpr std::string_view kEnvPrefix = "WALKIE_";

po::options_description describe_options() {
    po::options_description desc("walkie-relay options");
    desc.add_options()
        ("help,h", "show this help")
        ("host", po::value<std::string>()->default_value("0.0.0.0"), "listen address")
        ("port", po::value<int>()->default_value(3000), "listen port (0 picks a free one)")
        ("audio-dir", po::value<std::string>()->default_value("./audio_temp"), "directory for uploaded clips")
        ("max-upload-bytes", po::value<std::int64_t>()->default_value(10 * 1024 * 1024),
         "largest accepted upload or websocket frame")
        ("channel-sweep-interval", po::value<std::int64_t>()->default_value(60), "seconds between empty-channel sweeps")
        ("media-sweep-interval", po::value<std::int64_t>()->default_value(300), "seconds between stale-media sweeps")
        ("media-retention", po::value<std::int64_t>()->default_value(3600), "age in seconds after which clips are removed")
        ("stats-interval", po::value<std::int64_t>()->default_value(300), "seconds between stats log lines")
        ("shutdown-deadline", po::value<std::int64_t>()->default_value(10), "seconds a graceful shutdown may take")
        ("allow-cross-channel-signaling", po::value<bool>()->default_value(false)->implicit_value(true),
         "resolve `to` addresses across all channels")
        ("blocking-threads", po::value<std::int64_t>()->default_value(2), "threads for filesystem work");
    return desc;
}

std::chrono::seconds positive_seconds(const po::variables_map& vm, const char* name) {
    const auto v = vm[name].as<std::int64_t>();
    if (v <= 0) throw ConfigError(std::string("--") + name + " must be greater than zero");
    return std::chrono::seconds(v);
}

} // namespace

relay::JanitorSettings ServerConfig::janitor_settings() const {
    relay::JanitorSettings s;
    s.channel_sweep_interval = channel_sweep_interval;
    s.media_sweep_interval = media_sweep_interval;
    s.media_retention = media_retention;
    s.stats_interval = stats_interval;
    return s;
}

std::string environment_option_name(const std::string& variable) {
    if (variable == "PORT") return "port";
    if (variable.compare(0, kEnvPrefix.size(), kEnvPrefix) != 0) return {};

    std::string name = variable.substr(kEnvPrefix.size());
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return c == '_' ? '-' : static_cast<char>(std::tolower(c));
    });
    return name;
}

std::optional<ServerConfig> load_config(int argc, const char* const argv[], std::ostream& out) {
    const auto desc = describe_options();
    po::variables_map vm;

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        // Anything WALKIE_* that is not a known option is ignored rather than
        // rejected; the prefix is shared with client tooling.
        po::store(po::parse_environment(desc, [&desc](const std::string& variable) -> std::string {
            const auto name = environment_option_name(variable);
            if (name.empty() || name == "help") return {};
            return desc.find_nothrow(name, false) ? name : std::string{};
        }), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        throw ConfigError(e.what());
    }

    if (vm.count("help")) {
        out << desc << "\n";
        return std::nullopt;
    }

    ServerConfig cfg;
    cfg.host = vm["host"].as<std::string>();
    if (cfg.host.empty()) throw ConfigError("--host must not be empty");

    const int port = vm["port"].as<int>();
    if (port < 0 || port > 65535) throw ConfigError("--port must be between 0 and 65535");
    cfg.port = static_cast<unsigned short>(port);

    cfg.audio_dir = vm["audio-dir"].as<std::string>();
    if (cfg.audio_dir.empty()) throw ConfigError("--audio-dir must not be empty");

    const auto max_upload = vm["max-upload-bytes"].as<std::int64_t>();
    if (max_upload <= 0) throw ConfigError("--max-upload-bytes must be greater than zero");
    cfg.max_upload_bytes = static_cast<std::size_t>(max_upload);

    cfg.channel_sweep_interval = positive_seconds(vm, "channel-sweep-interval");
    cfg.media_sweep_interval = positive_seconds(vm, "media-sweep-interval");
    cfg.media_retention = positive_seconds(vm, "media-retention");
    cfg.stats_interval = positive_seconds(vm, "stats-interval");
    cfg.shutdown_deadline = positive_seconds(vm, "shutdown-deadline");

    cfg.allow_cross_channel_signaling = vm["allow-cross-channel-signaling"].as<bool>();

    const auto threads = vm["blocking-threads"].as<std::int64_t>();
    if (threads <= 0) throw ConfigError("--blocking-threads must be greater than zero");
    cfg.blocking_threads = static_cast<std::size_t>(threads);

    return cfg;
}

} // namespace walkierelay::config
