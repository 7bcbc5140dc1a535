#include "session/Receiver.h"

#include "chat/Classifier.h"
#include "chat/Envelope.h"
#include "session/Render.h"

#include <chrono>

namespace quichat::session {

Receiver::Receiver(Channel& channel, Terminal& terminal,
                   chat::ProbeTracker& probes, const chat::Identity& self)
    : channel_(channel), terminal_(terminal), probes_(probes), self_(self) {}

boost::system::error_code Receiver::run(CancellationToken& token) {
    for (;;) {
        boost::system::error_code ec;
        std::string datum = channel_.next(token, ec);
        if (ec) return ec;

        handle(datum, ec);
        if (ec) return ec;
    }
}

void Receiver::handle(const std::string& datum, boost::system::error_code& ec) {
    ec = {};

    auto env = chat::decode_envelope(datum);
    if (!env) {
        ++dropped_;
        return;
    }

    const chat::Classification c = chat::classify(*env, self_);

    switch (c.kind) {
        case chat::ControlKind::Probe: {
            if (c.is_local) return;
            auto reply = chat::make_probe_reply(self_, c.payload, std::chrono::system_clock::now());
            channel_.publish(chat::encode_envelope(reply), ec);
            return;
        }

        case chat::ControlKind::ProbeReply: {
            if (c.is_local) return;
            // Unknown or stale ids are not an error.
            auto elapsed = probes_.resolve(c.payload, chat::ProbeTracker::Clock::now());
            if (elapsed) terminal_.print(render_pong(env->nick, *elapsed));
            return;
        }

        case chat::ControlKind::Presence:
            if (c.is_local) return;
            terminal_.print(render_join(env->nick));
            return;

        case chat::ControlKind::Chat:
            terminal_.print(render_chat(env->nick, c.payload, std::chrono::system_clock::now()));
            return;
    }
}

} // namespace quichat::session
