#include "networking/WebSocketServer.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace walkierelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

std::string encode_envelope(std::string_view event, const json::value& payload) {
    json::object env;
    env["event"] = json::string_view(event.data(), event.size());
    env["data"] = payload;
    return json::serialize(env);
}

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& host, unsigned short port,
         util::IDGenerator& ids, std::size_t max_message_bytes)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(host), port)),
          ids_(ids),
          max_message_bytes_(max_message_bytes),
          port_(acceptor_.local_endpoint().port()) {}

    void start() { do_accept(); }

    unsigned short port() const { return port_; }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return sessions_.size();
    }

    void stop_accepting() {
        accepting_ = false;
        beast::error_code ec;
        acceptor_.close(ec);
        if (ec) std::cerr << "[ws] closing acceptor: " << ec.message() << "\n";
    }

    void close_all(std::function<void()> on_all_closed) {
        std::vector<std::shared_ptr<WsSession>> open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            on_all_closed_ = std::move(on_all_closed);
            for (auto& [id, s] : sessions_) open.push_back(s);
        }
        for (auto& s : open) s->close();
        maybe_all_closed();
    }

    void send(const ConnectionId& client, std::string_view event, const json::value& payload) {
        std::shared_ptr<WsSession> s;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = sessions_.find(client);
            if (it == sessions_.end()) return;
            s = it->second;
        }
        s->send(std::make_shared<const std::string>(encode_envelope(event, payload)));
    }

    void broadcast(const std::string& room, const std::optional<ConnectionId>& except,
                   std::string_view event, const json::value& payload) {
        std::vector<std::shared_ptr<WsSession>> targets;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto rit = rooms_.find(room);
            if (rit == rooms_.end()) return;
            for (const auto& id : rit->second) {
                if (except && id == *except) continue;
                auto sit = sessions_.find(id);
                if (sit != sessions_.end()) targets.push_back(sit->second);
            }
        }
        if (targets.empty()) return;

        // One serialization shared by every recipient's write queue.
        auto msg = std::make_shared<const std::string>(encode_envelope(event, payload));
        for (auto& s : targets) s->send(msg);
    }

    void join_room(const ConnectionId& id, const std::string& room) {
        std::lock_guard<std::mutex> lk(mu_);
        if (sessions_.find(id) == sessions_.end()) return;
        rooms_[room].insert(id);
        rooms_of_[id].insert(room);
    }

    void leave_room(const ConnectionId& id, const std::string& room) {
        std::lock_guard<std::mutex> lk(mu_);
        unbind(id, room);
        auto it = rooms_of_.find(id);
        if (it != rooms_of_.end()) {
            it->second.erase(room);
            if (it->second.empty()) rooms_of_.erase(it);
        }
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }
    void set_http_handler(HttpHandler h) { on_http_ = std::move(h); }

private:
    using Message = std::shared_ptr<const std::string>;

    class WsSession : public std::enable_shared_from_this<WsSession> {
    public:
        WsSession(Impl& server, tcp::socket socket, ConnectionId id)
            : server_(server),
              id_(std::move(id)),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void start(HttpRequest req) {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(server_.max_message_bytes_);

            auto upgrade = std::make_shared<HttpRequest>(std::move(req));
            ws_.async_accept(
                *upgrade,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this(), upgrade](beast::error_code ec) {
                        if (ec) {
                            self->fail("accept", ec);
                            return self->report_closed();
                        }
                        self->open_ = true;
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(Message msg) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg = std::move(msg)] {
                    if (self->closing_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        // Closes once everything already queued has been written.
        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (self->closing_) return;
                    self->closing_ = true;
                    if (self->write_queue_.empty()) self->do_close();
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        // Armed before dispatch so a throwing handler cannot stall this connection.
                        self->do_read();

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(*write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) return self->do_write();
                        if (self->closing_) self->do_close();
                    }));
        }

        void do_close() {
            if (!open_) {
                // Handshake still pending: dropping the socket fails the accept.
                beast::error_code ec;
                beast::get_lowest_layer(ws_).socket().close(ec);
                return;
            }
            ws_.async_close(
                websocket::close_code::going_away,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("close", ec);
                            self->report_closed();
                        }
                        // otherwise the pending read completes with `closed`
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            // WebSocket close is common; treat it as disconnect.
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("io", ec);
            }
            report_closed();
        }

        void report_closed() {
            if (reported_) return;
            reported_ = true;
            server_.session_closed(id_, open_);
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[ws " << id_ << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        ConnectionId id_;

        websocket::stream<beast::tcp_stream> ws_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::deque<Message> write_queue_;

        bool open_ = false;
        bool closing_ = false;
        bool reported_ = false;
    };

    // Reads one HTTP request at a time; an upgrade request hands the socket
    // over to a WsSession.
    class HttpSession : public std::enable_shared_from_this<HttpSession> {
    public:
        HttpSession(Impl& server, tcp::socket socket)
            : server_(server),
              stream_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        void start() { do_read(); }

    private:
        void do_read() {
            parser_.emplace();
            parser_->body_limit(server_.max_message_bytes_);
            stream_.expires_after(std::chrono::seconds(30));

            http::async_read(
                stream_, buffer_, *parser_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        self->on_read(ec);
                    }));
        }

        void on_read(beast::error_code ec) {
            if (ec == http::error::end_of_stream) return do_shutdown();
            if (ec == http::error::body_limit) {
                keep_alive_ = false;
                HttpResponse res{http::status::payload_too_large, version_};
                res.set(http::field::content_type, "application/json");
                res.body() = R"({"error":"File too large"})";
                return write(std::move(res));
            }
            if (ec) {
                if (ec != beast::error::timeout) fail("read", ec);
                return;
            }

            HttpRequest req = parser_->release();
            version_ = req.version();
            keep_alive_ = req.keep_alive();

            if (websocket::is_upgrade(req)) {
                stream_.expires_never();
                server_.upgrade(stream_.release_socket(), std::move(req));
                return;
            }

            if (!server_.on_http_) {
                HttpResponse res{http::status::not_found, version_};
                res.set(http::field::content_type, "application/json");
                res.body() = R"({"error":"Not found"})";
                return write(std::move(res));
            }

            server_.on_http_(std::move(req), [self = shared_from_this()](HttpResponse res) {
                asio::post(self->strand_, [self, res = std::move(res)]() mutable {
                    self->write(std::move(res));
                });
            });
        }

        void write(HttpResponse res) {
            res_ = std::make_shared<HttpResponse>(std::move(res));
            res_->version(version_);
            res_->keep_alive(keep_alive_);
            res_->prepare_payload();

            http::async_write(
                stream_, *res_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->fail("write", ec);
                        if (self->res_->need_eof()) return self->do_shutdown();
                        self->res_.reset();
                        self->do_read();
                    }));
        }

        void do_shutdown() {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[http] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        beast::tcp_stream stream_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::optional<http::request_parser<http::string_body>> parser_;
        std::shared_ptr<HttpResponse> res_;

        unsigned version_ = 11;
        bool keep_alive_ = true;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted || !accepting_) return;
                    std::cerr << "[accept] " << ec.message() << "\n";
                    return do_accept();
                }

                std::make_shared<HttpSession>(*this, std::move(socket))->start();
                do_accept();
            });
    }

    void upgrade(tcp::socket socket, HttpRequest req) {
        if (!accepting_) {
            beast::error_code ec;
            socket.close(ec);
            return;
        }

        auto id = ids_.connectionID();
        auto session = std::make_shared<WsSession>(*this, std::move(socket), id);
        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_[id] = session;
        }
        session->start(std::move(req));
    }

    void session_closed(const ConnectionId& id, bool was_open) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            sessions_.erase(id);
            auto it = rooms_of_.find(id);
            if (it != rooms_of_.end()) {
                for (const auto& room : it->second) unbind(id, room);
                rooms_of_.erase(it);
            }
        }
        if (was_open && on_disconnect_) on_disconnect_(id);
        maybe_all_closed();
    }

    void maybe_all_closed() {
        std::function<void()> cb;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!on_all_closed_ || !sessions_.empty()) return;
            cb = std::move(on_all_closed_);
            on_all_closed_ = nullptr;
        }
        asio::post(ioc_, std::move(cb));
    }

    // Caller holds mu_.
    void unbind(const ConnectionId& id, const std::string& room) {
        auto it = rooms_.find(room);
        if (it == rooms_.end()) return;
        it->second.erase(id);
        if (it->second.empty()) rooms_.erase(it);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    util::IDGenerator& ids_;
    std::size_t max_message_bytes_;
    unsigned short port_;

    std::atomic<bool> accepting_{true};

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::shared_ptr<WsSession>> sessions_;
    std::unordered_map<std::string, std::set<ConnectionId>> rooms_;
    std::unordered_map<ConnectionId, std::set<std::string>> rooms_of_;
    std::function<void()> on_all_closed_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
    HttpHandler on_http_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, const std::string& host, unsigned short port,
                                 util::IDGenerator& ids, std::size_t max_message_bytes)
    : impl_(new Impl(ioc, host, port, ids, max_message_bytes)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }
void WebSocketServer::set_http_handler(HttpHandler handler) { impl_->set_http_handler(std::move(handler)); }

void WebSocketServer::start() { impl_->start(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::connection_count() const { return impl_->connection_count(); }

void WebSocketServer::send(const ConnectionId& to, std::string_view event, const json::value& payload) {
    impl_->send(to, event, payload);
}

void WebSocketServer::broadcast(const std::string& room, const std::optional<ConnectionId>& except,
                                std::string_view event, const json::value& payload) {
    impl_->broadcast(room, except, event, payload);
}

void WebSocketServer::join_room(const ConnectionId& id, const std::string& room) { impl_->join_room(id, room); }
void WebSocketServer::leave_room(const ConnectionId& id, const std::string& room) { impl_->leave_room(id, room); }

void WebSocketServer::stop_accepting() { impl_->stop_accepting(); }
void WebSocketServer::close_all(std::function<void()> on_all_closed) { impl_->close_all(std::move(on_all_closed)); }

WebSocketServer::~WebSocketServer() = default;

} // namespace walkierelay::networking
