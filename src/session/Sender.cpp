#include "session/Sender.h"

#include "chat/Commands.h"
#include "chat/Envelope.h"
#include "session/Errors.h"
#include "session/Render.h"

#include <chrono>

namespace quichat::session {

Sender::Sender(Channel& channel, Terminal& terminal, chat::ProbeTracker& probes,
               const chat::Identity& self, chat::IDGenerator& idgen, CancellationToken& token)
    : channel_(channel), terminal_(terminal), probes_(probes),
      self_(self), idgen_(idgen), token_(token) {}

boost::system::error_code Sender::run() {
    for (;;) {
        boost::system::error_code ec;
        std::string line = terminal_.read_line(token_, ec);
        if (ec == errc::interrupted) continue;
        if (ec) return ec;

        if (handle_line(line, ec) == Outcome::Quit) return {};
        if (ec) return ec;
    }
}

Sender::Outcome Sender::handle_line(const std::string& line, boost::system::error_code& ec) {
    ec = {};
    if (line.empty()) return Outcome::Continue;

    if (auto cmd = chat::parse_command(line)) {
        switch (cmd->kind) {
            case chat::CommandKind::List:
                terminal_.print(render_peers(channel_.list_peers()));
                return Outcome::Continue;

            case chat::CommandKind::Ping:
                send_probe(ec);
                return Outcome::Continue;

            case chat::CommandKind::Help:
                terminal_.print(std::string(chat::kHelpText));
                return Outcome::Continue;

            case chat::CommandKind::Quit:
                terminal_.print(render_farewell());
                token_.cancel();
                return Outcome::Quit;

            case chat::CommandKind::Unknown:
                terminal_.print(render_unknown_command(cmd->word));
                return Outcome::Continue;
        }
    }

    // Our own copy comes back through the channel and is rendered there.
    terminal_.retract_echo();

    auto env = chat::make_chat(self_, line, std::chrono::system_clock::now());
    channel_.publish(chat::encode_envelope(env), ec);
    return Outcome::Continue;
}

void Sender::send_probe(boost::system::error_code& ec) {
    std::string id = idgen_.probeID();
    probes_.record(id, chat::ProbeTracker::Clock::now());

    auto env = chat::make_probe(self_, id, std::chrono::system_clock::now());
    channel_.publish(chat::encode_envelope(env), ec);
}

} // namespace quichat::session
