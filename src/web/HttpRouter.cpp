#include "web/HttpRouter.h"

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/json.hpp>

#include <cstdio>
#include <ctime>
#include <iostream>
#include <utility>

namespace walkierelay::web {

namespace http = boost::beast::http;
namespace json = boost::json;
using networking::HttpRequest;
using networking::HttpResponse;

namespace {

constexpr const char* kVersion = "1.0.0";
constexpr std::string_view kAudioPrefix = "/audio/";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        const char c = in[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

HttpResponse make_json(http::status status, const json::value& body) {
    HttpResponse res{status, 11};
    res.set(http::field::server, "walkie-relay");
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.body() = json::serialize(body);
    res.prepare_payload();
    return res;
}

HttpResponse make_error(http::status status, const char* message) {
    return make_json(status, json::object{{"error", message}});
}

} // namespace

RequestTarget parse_target(std::string_view target) {
    RequestTarget out;
    const auto qpos = target.find('?');
    out.path = std::string(target.substr(0, qpos));
    if (qpos == std::string_view::npos) return out;

    std::string_view query = target.substr(qpos + 1);
    while (!query.empty()) {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            std::string key = percent_decode(pair.substr(0, eq));
            std::string value = eq == std::string_view::npos ? std::string{} : percent_decode(pair.substr(eq + 1));
            out.query.emplace(std::move(key), std::move(value));  // first occurrence wins
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return out;
}

std::string iso8601_utc(std::int64_t ms_since_epoch) {
    std::int64_t secs = ms_since_epoch / 1000;
    std::int64_t millis = ms_since_epoch % 1000;
    if (millis < 0) {
        millis += 1000;
        --secs;
    }
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(n), buf, static_cast<int>(millis));
    return out;
}

HttpRouter::HttpRouter(relay::RelayContext& ctx, relay::MediaRelay& relay, media::MediaStore& store)
    : ctx_(ctx), relay_(relay), store_(store), started_(std::chrono::steady_clock::now()) {}

void HttpRouter::handle(HttpRequest req, networking::WebSocketServer::HttpReply reply) {
    const RequestTarget target = parse_target(std::string_view(req.target().data(), req.target().size()));
    const auto verb = req.method();

    if (verb == http::verb::options) {
        HttpResponse res{http::status::no_content, req.version()};
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Content-Type");
        res.prepare_payload();
        reply(std::move(res));
        return;
    }

    if (verb == http::verb::get) {
        if (target.path == "/") {
            reply(status_page());
            return;
        }
        if (target.path == "/health") {
            reply(health());
            return;
        }
        if (target.path == "/channels") {
            reply(channels());
            return;
        }
        if (target.path.compare(0, kAudioPrefix.size(), kAudioPrefix) == 0) {
            serve_audio(target.path.substr(kAudioPrefix.size()), std::move(reply));
            return;
        }
    } else if (verb == http::verb::post && target.path == "/upload-audio") {
        upload(std::move(req), target, std::move(reply));
        return;
    }

    reply(make_error(http::status::not_found, "Not found"));
}

HttpResponse HttpRouter::status_page() const {
    return make_json(http::status::ok, json::object{
        {"status", "ok"},
        {"message", "Walkie-Talkie relay running"},
        {"version", kVersion},
        {"channels", ctx_.directory().size()},
        {"users", ctx_.registry().size()},
        {"timestamp", iso8601_utc(ctx_.now_ms())},
    });
}

HttpResponse HttpRouter::health() const {
    const std::chrono::duration<double> up = std::chrono::steady_clock::now() - started_;
    return make_json(http::status::ok, json::object{
        {"status", "healthy"},
        {"uptime", up.count()},
        {"channels", ctx_.directory().size()},
        {"users", ctx_.registry().size()},
    });
}

HttpResponse HttpRouter::channels() const {
    json::array list;
    for (const auto& channel : ctx_.directory().snapshot()) {
        json::array users;
        for (const auto& m : channel.members) {
            users.push_back(json::object{
                {"userId", m.user_id},
                {"joinedAt", iso8601_utc(m.joined_at_ms)},
            });
        }
        list.push_back(json::object{
            {"id", channel.channel_id},
            {"userCount", channel.members.size()},
            {"users", std::move(users)},
        });
    }
    return make_json(http::status::ok, list);
}

void HttpRouter::upload(HttpRequest req, const RequestTarget& target,
                        networking::WebSocketServer::HttpReply reply) {
    const auto channel = target.query.find("channelId");
    if (req.body().empty() || channel == target.query.end() || channel->second.empty()) {
        reply(make_error(http::status::bad_request, "No audio file provided"));
        return;
    }

    const auto user = target.query.find("userId");
    if (user == target.query.end() || user->second.empty()) {
        reply(make_error(http::status::bad_request, "Missing userId"));
        return;
    }
    std::string user_id = user->second;
    const auto host_field = req[http::field::host];
    std::string host(host_field.data(), host_field.size());
    if (host.empty()) host = "localhost";

    const std::size_t size = req.body().size();
    store_.store(std::move(req.body()),
                 [this, reply = std::move(reply), channel_id = channel->second,
                  user_id = std::move(user_id), host = std::move(host), size](media::StoreResult result) {
        if (!result.filename) {
            std::cerr << "[http] upload failed: " << result.error << "\n";
            reply(make_error(http::status::internal_server_error, "Upload failed"));
            return;
        }
        const std::string& file = *result.filename;
        std::cout << "[media] stored " << file << " (" << size << " bytes) for channel " << channel_id << "\n";

        relay_.announce_upload(channel_id, user_id, "http://" + host + "/audio/" + file);
        reply(make_json(http::status::ok, json::object{
            {"success", true},
            {"audioUrl", "/audio/" + file},
            {"filename", file},
        }));
    });
}

void HttpRouter::serve_audio(const std::string& name, networking::WebSocketServer::HttpReply reply) {
    if (!media::MediaStore::is_safe_name(name)) {
        reply(make_error(http::status::bad_request, "Invalid file name"));
        return;
    }
    store_.read(name, [reply = std::move(reply)](std::optional<std::string> bytes) {
        if (!bytes) {
            reply(make_error(http::status::not_found, "Not found"));
            return;
        }
        HttpResponse res{http::status::ok, 11};
        res.set(http::field::server, "walkie-relay");
        res.set(http::field::content_type, "audio/mp4");
        res.set(http::field::access_control_allow_origin, "*");
        res.body() = std::move(*bytes);
        res.prepare_payload();
        reply(std::move(res));
    });
}

} // namespace walkierelay::web
