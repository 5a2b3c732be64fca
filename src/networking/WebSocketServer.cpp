#include "WebSocketServer.h"

#include "common/Log.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace nexus::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {
constexpr auto kHttpReadTimeout = std::chrono::seconds(30);
}

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(tcp::v4(), port)) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Close all sessions
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, s] : sessions_) {
            s->close();
        }
        sessions_.clear();
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    void send(ClientId client, const std::string& msg) {
        if (auto s = find(client)) s->send(msg);
    }

    void ping(ClientId client) {
        if (auto s = find(client)) s->ping();
    }

    void terminate(ClientId client) {
        if (auto s = find(client)) s->terminate();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }
    void set_on_pong(OnPong cb) { on_pong_ = std::move(cb); }
    void set_on_http(OnHttp cb) { on_http_ = std::move(cb); }

private:
    class Session : public std::enable_shared_from_this<Session> {
    public:
        Session(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        ClientId id() const { return id_; }

        // Every connection starts as HTTP; upgrades become WebSocket sessions,
        // anything else gets one reply and is closed.
        void start() {
            asio::post(strand_, [self = shared_from_this()] { self->do_read_request(); });
        }

        void send(const std::string& msg) {
            enqueue(Outgoing{Outgoing::Kind::Text, msg});
        }

        void ping() {
            enqueue(Outgoing{Outgoing::Kind::Ping, {}});
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (!self->upgraded_ || self->finished_) return self->shutdown_socket();
                    self->ws_.async_close(
                        websocket::close_code::going_away,
                        asio::bind_executor(self->strand_, [self](beast::error_code ec) {
                            if (ec) self->on_close_or_fail(ec);
                        }));
                });
        }

        void terminate() {
            asio::post(strand_, [self = shared_from_this()] { self->shutdown_socket(); });
        }

    private:
        struct Outgoing {
            enum class Kind { Text, Ping };
            Kind kind;
            std::string data;
        };

        void do_read_request() {
            beast::get_lowest_layer(ws_).expires_after(kHttpReadTimeout);
            http::async_read(
                ws_.next_layer(),
                buffer_,
                req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) {
                            if (ec != http::error::end_of_stream) self->fail("http read", ec);
                            return self->finish();
                        }
                        if (websocket::is_upgrade(self->req_)) return self->do_upgrade();
                        self->do_http_reply();
                    }));
        }

        void do_upgrade() {
            beast::get_lowest_layer(ws_).expires_never();
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.text(true);

            // Invoked from inside async_read, which keeps the session alive.
            ws_.control_callback([this](websocket::frame_type kind, beast::string_view) {
                if (kind == websocket::frame_type::pong && server_.on_pong_) server_.on_pong_(id_);
            });

            ws_.async_accept(
                req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("accept", ec);
                            return self->finish();
                        }

                        self->upgraded_ = true;
                        self->buffer_.consume(self->buffer_.size());
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void do_http_reply() {
            HttpReply reply;
            if (server_.on_http_) {
                reply = server_.on_http_(std::string_view(req_.method_string().data(), req_.method_string().size()),
                                         std::string_view(req_.target().data(), req_.target().size()));
            }

            res_.emplace(static_cast<http::status>(reply.status), req_.version());
            res_->set(http::field::content_type, "application/json");
            res_->keep_alive(false);
            res_->body() = std::move(reply.body);
            res_->prepare_payload();

            http::async_write(
                ws_.next_layer(),
                *res_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) self->fail("http write", ec);
                        self->shutdown_socket();
                        self->finish();
                    }));
        }

        void enqueue(Outgoing out) {
            asio::post(
                strand_,
                [self = shared_from_this(), out = std::move(out)]() mutable {
                    if (self->finished_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(out));
                    // Frames queued before the handshake completes go out right after it.
                    if (!writing && self->upgraded_) self->do_write();
                });
        }

        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            auto on_written = asio::bind_executor(
                strand_,
                [self = shared_from_this()](beast::error_code ec, std::size_t = 0) {
                    if (ec) return self->on_close_or_fail(ec);

                    self->write_queue_.pop_front();
                    // Nothing is in flight now; a finished session drops the rest.
                    if (self->finished_) return self->write_queue_.clear();
                    if (!self->write_queue_.empty()) self->do_write();
                });

            const Outgoing& front = write_queue_.front();
            if (front.kind == Outgoing::Kind::Ping) {
                ws_.async_ping({}, std::move(on_written));
            } else {
                ws_.async_write(asio::buffer(front.data), std::move(on_written));
            }
        }

        void on_close_or_fail(beast::error_code ec) {
            // Peer close, our own terminate() and shutdown are routine.
            if (ec != websocket::error::closed && ec != asio::error::operation_aborted &&
                ec != asio::error::eof && ec != asio::error::bad_descriptor) {
                fail("io", ec);
            }
            finish();
        }

        void shutdown_socket() {
            beast::error_code ec;
            auto& sock = beast::get_lowest_layer(ws_).socket();
            sock.shutdown(tcp::socket::shutdown_both, ec);
            sock.close(ec);
        }

        // Reports the disconnect once, however many completions fail afterwards.
        void finish() {
            if (finished_) return;
            finished_ = true;
            // The queue front may still back a pending async_write; the write
            // handler releases it.
            server_.remove_session(id_);
            if (upgraded_ && server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            log::warn("session " + std::to_string(id_), what, ": ", ec.message());
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        std::optional<http::response<http::string_body>> res_;

        std::deque<Outgoing> write_queue_;
        bool upgraded_ = false;
        bool finished_ = false;
    };

    std::shared_ptr<Session> find(ClientId client) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(client);
        if (it == sessions_.end()) return nullptr;
        return it->second;
    }

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    log::warn("accept", ec.message());
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto session = std::make_shared<Session>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    sessions_[id] = session;
                }

                session->start();
                do_accept();
            });
    }

    void remove_session(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Session>> sessions_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
    OnPong on_pong_;
    OnHttp on_http_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, unsigned short port)
    : impl_(new Impl(ioc, port)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }
void WebSocketServer::set_on_pong(OnPong cb) { impl_->set_on_pong(std::move(cb)); }
void WebSocketServer::set_on_http(OnHttp cb) { impl_->set_on_http(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }

void WebSocketServer::send(ClientId client, const std::string& frame) { impl_->send(client, frame); }
void WebSocketServer::ping(ClientId client) { impl_->ping(client); }
void WebSocketServer::terminate(ClientId client) { impl_->terminate(client); }

WebSocketServer::~WebSocketServer() = default;

} // namespace nexus::networking
