#pragma once

#include "media/MediaStore.h"
#include "networking/WebSocketServer.h"
#include "relay/MediaRelay.h"
#include "relay/RelayContext.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace walkierelay::web {

struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> query;
};

// Splits "/path?a=1&b=x%20y" and percent-decodes the query values.
RequestTarget parse_target(std::string_view target);

// 2024-05-01T12:00:00.000Z
std::string iso8601_utc(std::int64_t ms_since_epoch);

// Read-only status endpoints plus the upload bridge into the relay:
//   GET /, /health, /channels, /audio/<file>; POST /upload-audio
class HttpRouter {
public:
    HttpRouter(relay::RelayContext& ctx, relay::MediaRelay& relay, media::MediaStore& store);

    void handle(networking::HttpRequest req, networking::WebSocketServer::HttpReply reply);

private:
    networking::HttpResponse status_page() const;
    networking::HttpResponse health() const;
    networking::HttpResponse channels() const;
    void upload(networking::HttpRequest req, const RequestTarget& target,
                networking::WebSocketServer::HttpReply reply);
    void serve_audio(const std::string& name, networking::WebSocketServer::HttpReply reply);

    relay::RelayContext& ctx_;
    relay::MediaRelay& relay_;
    media::MediaStore& store_;
    std::chrono::steady_clock::time_point started_;
};

} // namespace walkierelay::web
