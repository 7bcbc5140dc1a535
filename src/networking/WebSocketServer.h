#pragma once

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace quichat::networking {

using ClientId = std::uint64_t;

class WebSocketServer {
public:
    // target is the HTTP request target of the upgrade, e.g. "/quichat:global"
    using OnConnect    = std::function<void(ClientId, const std::string& target)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnMessage    = std::function<void(ClientId, const std::string&)>;

    // port 0 picks an ephemeral port, see port()
    WebSocketServer(boost::asio::io_context& ioc, unsigned short port);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_message(OnMessage cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    unsigned short port() const;

    // Queue a text frame for a client; unknown clients are ignored.
    void send(ClientId client, const std::string& msg);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace quichat::networking
