#include "session/PresenceAnnouncer.h"

#include "chat/Envelope.h"

namespace quichat::session {

PresenceAnnouncer::PresenceAnnouncer(Channel& channel, const chat::Identity& self, Interval interval)
    : channel_(channel), self_(self), interval_(interval) {}

boost::system::error_code PresenceAnnouncer::run(CancellationToken& token) {
    while (!latched_.load()) {
        if (token.wait_for(interval_)) return {};

        boost::system::error_code ec;
        poll(ec);
        if (ec) return ec;
    }
    return {};
}

bool PresenceAnnouncer::poll(boost::system::error_code& ec) {
    ec = {};
    if (latched_.load()) return false;
    if (channel_.list_peers().empty()) return false;

    bool expected = false;
    if (!latched_.compare_exchange_strong(expected, true)) return false;

    auto env = chat::make_presence(self_, std::chrono::system_clock::now());
    channel_.publish(chat::encode_envelope(env), ec);
    if (ec) return false;

    if (on_announced_) on_announced_();
    return true;
}

} // namespace quichat::session
