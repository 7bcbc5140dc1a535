#pragma once

#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "session/Channel.h"
#include "session/MessageQueue.hpp"

namespace quichat::networking {

// Channel backed by a TopicRelay over WebSocket. connect() is synchronous
// and returns once the relay has assigned our peer id; afterwards an io
// thread reads frames into the inbox and drains the write queue.
class WebSocketChannel : public session::Channel {
public:
    WebSocketChannel(std::string host, std::string port, std::string topic);
    ~WebSocketChannel() override;

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    // Throws boost::system::system_error when the relay is unreachable or
    // the handshake fails.
    void connect();
    void close();

    const std::string& peer_id() const noexcept { return peer_id_; }
    const std::string& topic() const noexcept { return topic_; }
    bool is_open() const noexcept { return open_.load(); }

    // Why the connection dropped; empty after a clean close.
    boost::system::error_code last_error(std::string* what = nullptr) const;

    void publish(const std::string& payload, boost::system::error_code& ec) override;
    std::string next(session::CancellationToken& token, boost::system::error_code& ec) override;
    std::vector<std::string> list_peers() const override;

private:
    void do_read();
    void do_write();
    void handle_frame(const std::string& text);
    void on_fail(const char* what, boost::beast::error_code ec);

    const std::string host_;
    const std::string port_;
    std::string topic_;
    std::string peer_id_;

    boost::asio::io_context ioc_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;  // io thread only

    session::MessageQueue<std::string> inbox_;

    mutable std::mutex mu_;
    std::vector<std::string> peers_;
    boost::system::error_code failure_;
    std::string failure_what_;

    std::atomic<bool> open_{false};
    std::thread io_thread_;
};

} // namespace quichat::networking
