#pragma once

#include "networking/Transport.h"

#include <boost/asio/io_context.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace nexus::networking {

// Plain HTTP answer for requests that are not WebSocket upgrades.
struct HttpReply {
    unsigned status = 404;
    std::string body;
};

class WebSocketServer : public Transport {
public:
    using OnConnect    = std::function<void(ClientId)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;
    using OnPong       = std::function<void(ClientId)>;
    using OnHttp       = std::function<HttpReply(std::string_view method, std::string_view target)>;

    // Binds immediately; throws boost::system::system_error if the port is taken.
    WebSocketServer(boost::asio::io_context& ioc, unsigned short port);
    ~WebSocketServer() override;

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Callbacks run on the connection's strand; set them before start().
    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);
    void set_on_pong(OnPong cb);
    void set_on_http(OnHttp cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    unsigned short port() const;

    void send(ClientId client, const std::string& frame) override;
    void ping(ClientId client) override;
    void terminate(ClientId client) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace nexus::networking
