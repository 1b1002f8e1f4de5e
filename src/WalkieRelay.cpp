#include "config/ServerConfig.h"
#include "media/MediaStore.h"
#include "networking/WebSocketServer.h"
#include "relay/EventDispatcher.h"
#include "relay/Janitor.h"
#include "relay/LifecycleController.h"
#include "relay/MediaRelay.h"
#include "relay/PresenceBroadcaster.h"
#include "relay/RelayContext.h"
#include "relay/SignalingRouter.h"
#include "util/IDGenerator.hpp"
#include "web/HttpRouter.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/system/system_error.hpp>

#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace config = walkierelay::config;

static constexpr int kExitInvalidConfig = 2;

int main(int argc, char* argv[]) {
    using namespace walkierelay;

    std::optional<config::ServerConfig> loaded;
    try {
        loaded = config::load_config(argc, argv, std::cout);
    } catch (const config::ConfigError& e) {
        std::cerr << "[walkie-relay] invalid configuration: " << e.what() << "\n";
        return kExitInvalidConfig;
    }
    if (!loaded) return 0;
    const config::ServerConfig& cfg = *loaded;

    boost::asio::io_context ioc;
    boost::asio::thread_pool blocking(cfg.blocking_threads);
    util::IDGenerator idgen;

    media::MediaStore store(ioc, blocking, cfg.audio_dir, idgen);
    try {
        store.ensure_directory();
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[media] cannot use " << cfg.audio_dir << ": " << e.what() << "\n";
        blocking.join();
        return 1;
    }

    std::unique_ptr<networking::WebSocketServer> listener;
    try {
        listener = std::make_unique<networking::WebSocketServer>(ioc, cfg.host, cfg.port, idgen,
                                                                 cfg.max_upload_bytes);
    } catch (const boost::system::system_error& e) {
        std::cerr << "[walkie-relay] cannot listen on " << cfg.host << ":" << cfg.port << ": " << e.what() << "\n";
        blocking.join();
        return 1;
    }
    networking::WebSocketServer& server = *listener;

    relay::RelayContext ctx(server);
    relay::PresenceBroadcaster presence(ctx);
    relay::SignalingRouter signaling(ctx, cfg.allow_cross_channel_signaling);
    relay::MediaRelay media_relay(ctx);
    relay::EventDispatcher dispatcher(ctx, presence, signaling, media_relay);
    web::HttpRouter http(ctx, media_relay, store);

    relay::Janitor janitor(ioc, ctx, &store, cfg.janitor_settings());
    relay::LifecycleController lifecycle(ioc, ctx, cfg.shutdown_deadline);

    dispatcher.set_gate([&lifecycle] { return lifecycle.accepting_events(); });

    server.set_on_connect([&](const networking::ConnectionId& id) { dispatcher.on_connect(id); });
    server.set_on_disconnect([&](const networking::ConnectionId& id) { dispatcher.on_disconnect(id); });
    server.set_on_message([&](const networking::ConnectionId& id, const std::string& frame) {
        dispatcher.on_message(id, frame);
    });
    server.set_http_handler([&](networking::HttpRequest req, networking::WebSocketServer::HttpReply reply) {
        http.handle(std::move(req), std::move(reply));
    });

    lifecycle.set_on_draining([&janitor] { janitor.stop(); });
    lifecycle.set_drain_hook([&store](std::function<void()> done) {
        store.purge([done = std::move(done)](std::size_t removed) {
            std::cout << "[media] removed " << removed << " stored clip(s)\n";
            done();
        });
    });
    lifecycle.set_on_stopped([&ioc](int) { ioc.stop(); });

    server.start();
    janitor.start();
    lifecycle.watch_signals();

    std::cout << "[walkie-relay] listening on " << cfg.host << ":" << server.port()
              << " (media in " << cfg.audio_dir << ")\n";

    for (;;) {
        try {
            ioc.run();
            break;
        } catch (const std::exception& e) {
            lifecycle.report_fault("event loop", e);
        }
    }

    blocking.join();
    std::cout << "[walkie-relay] exit (" << lifecycle.exit_code() << ")\n";
    return lifecycle.exit_code();
}
