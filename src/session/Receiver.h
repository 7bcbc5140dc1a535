#pragma once

#include <atomic>
#include <cstddef>
#include <string>

#include <boost/system/error_code.hpp>

#include "chat/Identity.h"
#include "chat/ProbeTracker.h"
#include "session/Cancellation.h"
#include "session/Channel.h"
#include "session/Terminal.h"

namespace quichat::session {

// Sole consumer of the channel: decodes, classifies and reacts to every
// incoming envelope (reply to probes, report latencies, render chat and
// joins, swallow our own control echoes).
class Receiver {
public:
    Receiver(Channel& channel, Terminal& terminal,
             chat::ProbeTracker& probes, const chat::Identity& self);

    // Runs until the channel fetch fails and returns the cause.
    boost::system::error_code run(CancellationToken& token);

    // One datum. ec is set only for failures that end the session.
    void handle(const std::string& datum, boost::system::error_code& ec);

    std::size_t dropped() const noexcept { return dropped_.load(); }

private:
    Channel& channel_;
    Terminal& terminal_;
    chat::ProbeTracker& probes_;
    const chat::Identity& self_;

    std::atomic<std::size_t> dropped_{0};
};

} // namespace quichat::session
