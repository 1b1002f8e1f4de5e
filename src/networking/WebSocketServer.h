#pragma once

#include "networking/Transport.h"
#include "util/IDGenerator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace walkierelay::networking {

using HttpRequest  = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// WebSocket + plain HTTP on one port. Upgrade requests become relay
// connections; everything else goes to the HTTP handler.
class WebSocketServer : public Transport {
public:
    using OnConnect    = std::function<void(const ConnectionId&)>;
    using OnDisconnect = std::function<void(const ConnectionId&)>;
    using OnMessage    = std::function<void(const ConnectionId&, const std::string&)>;
    using HttpReply    = std::function<void(HttpResponse)>;
    using HttpHandler  = std::function<void(HttpRequest, HttpReply)>;

    WebSocketServer(boost::asio::io_context& ioc, const std::string& host, unsigned short port,
                    util::IDGenerator& ids, std::size_t max_message_bytes);
    ~WebSocketServer() override;

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);
    void set_http_handler(HttpHandler handler);

    void start();  // start accepting

    unsigned short port() const;  // bound port, useful when configured as 0
    std::size_t connection_count() const;

    void send(const ConnectionId& to, std::string_view event,
              const boost::json::value& payload) override;
    void broadcast(const std::string& room, const std::optional<ConnectionId>& except,
                   std::string_view event, const boost::json::value& payload) override;
    void join_room(const ConnectionId& id, const std::string& room) override;
    void leave_room(const ConnectionId& id, const std::string& room) override;
    void stop_accepting() override;
    void close_all(std::function<void()> on_all_closed) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// {"event": event, "data": payload}
std::string encode_envelope(std::string_view event, const boost::json::value& payload);

} // namespace walkierelay::networking
