#pragma once

#include <string>

#include <boost/system/error_code.hpp>

#include "chat/IDGenerator.hpp"
#include "chat/Identity.h"
#include "chat/ProbeTracker.h"
#include "session/Cancellation.h"
#include "session/Channel.h"
#include "session/Terminal.h"

namespace quichat::session {

// Turns terminal lines into slash commands or outgoing chat envelopes.
class Sender {
public:
    enum class Outcome { Continue, Quit };

    Sender(Channel& channel, Terminal& terminal, chat::ProbeTracker& probes,
           const chat::Identity& self, chat::IDGenerator& idgen, CancellationToken& token);

    // Returns success after /quit, otherwise the error that ended input.
    boost::system::error_code run();

    Outcome handle_line(const std::string& line, boost::system::error_code& ec);

private:
    void send_probe(boost::system::error_code& ec);

    Channel& channel_;
    Terminal& terminal_;
    chat::ProbeTracker& probes_;
    const chat::Identity& self_;
    chat::IDGenerator& idgen_;
    CancellationToken& token_;
};

} // namespace quichat::session
