#include "networking/WebSocketChannel.h"

#include "networking/RelayProtocol.h"
#include "session/Errors.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <utility>

namespace quichat::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

WebSocketChannel::WebSocketChannel(std::string host, std::string port, std::string topic)
    : host_(std::move(host)),
      port_(std::move(port)),
      topic_(std::move(topic)),
      ws_(asio::make_strand(ioc_)) {}

WebSocketChannel::~WebSocketChannel() {
    close();
}

void WebSocketChannel::connect() {
    tcp::resolver resolver(ioc_);
    auto const results = resolver.resolve(host_, port_);
    beast::get_lowest_layer(ws_).connect(results);

    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::request_type& req) {
            req.set(beast::http::field::user_agent, "quichat");
        }));
    ws_.handshake(host_ + ":" + port_, "/" + topic_);

    // The relay greets every connection before anything else.
    ws_.read(buffer_);
    auto welcome = decode_relay_frame(beast::buffers_to_string(buffer_.data()));
    buffer_.consume(buffer_.size());
    if (!welcome || welcome->type != RelayFrame::Type::Welcome) {
        throw boost::system::system_error(session::errc::not_connected, "relay welcome");
    }
    peer_id_ = welcome->peer_id;
    topic_ = welcome->topic;

    websocket::stream_base::timeout opt =
        websocket::stream_base::timeout::suggested(beast::role_type::client);
    opt.handshake_timeout = std::chrono::seconds(5);
    ws_.set_option(opt);

    open_ = true;
    asio::post(ws_.get_executor(), [this] { do_read(); });
    io_thread_ = std::thread([this] { ioc_.run(); });
}

void WebSocketChannel::close() {
    if (!io_thread_.joinable()) return;

    asio::post(ws_.get_executor(), [this] {
        if (!open_) return;
        ws_.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
            if (ec) on_fail("close", ec);
        });
    });
    io_thread_.join();
    inbox_.close();
}

void WebSocketChannel::publish(const std::string& payload, boost::system::error_code& ec) {
    if (!open_) {
        ec = session::errc::channel_closed;
        return;
    }
    ec = {};
    asio::post(ws_.get_executor(), [this, payload] {
        if (!open_) return;
        bool writing = !write_queue_.empty();
        write_queue_.push_back(payload);
        if (!writing) do_write();
    });
}

std::string WebSocketChannel::next(session::CancellationToken& token, boost::system::error_code& ec) {
    auto payload = inbox_.pop(token, ec);
    if (!payload) return {};
    return std::move(*payload);
}

std::vector<std::string> WebSocketChannel::list_peers() const {
    std::lock_guard<std::mutex> lk(mu_);
    return peers_;
}

void WebSocketChannel::do_read() {
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
        if (ec) return on_fail("read", ec);

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        handle_frame(text);

        do_read();
    });
}

void WebSocketChannel::do_write() {
    ws_.text(true);
    ws_.async_write(asio::buffer(write_queue_.front()), [this](beast::error_code ec, std::size_t) {
        if (ec) return on_fail("write", ec);

        write_queue_.pop_front();
        if (!write_queue_.empty()) do_write();
    });
}

void WebSocketChannel::handle_frame(const std::string& text) {
    auto frame = decode_relay_frame(text);
    if (!frame) return;

    switch (frame->type) {
        case RelayFrame::Type::Data:
            inbox_.push(std::move(frame->data));
            break;
        case RelayFrame::Type::Peers: {
            std::lock_guard<std::mutex> lk(mu_);
            peers_ = std::move(frame->peers);
            break;
        }
        case RelayFrame::Type::Welcome:
            break;
    }
}

// The session sees the closure through next() and publish(); the cause is
// kept for the final report.
void WebSocketChannel::on_fail(const char* what, beast::error_code ec) {
    open_ = false;
    inbox_.close();

    std::lock_guard<std::mutex> lk(mu_);
    peers_.clear();
    if (!failure_ && ec != websocket::error::closed) {
        failure_ = ec;
        failure_what_ = what;
    }
}

boost::system::error_code WebSocketChannel::last_error(std::string* what) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (what) *what = failure_what_;
    return failure_;
}

} // namespace quichat::networking
