#pragma once

#include <atomic>
#include <chrono>
#include <functional>

#include <boost/system/error_code.hpp>

#include "chat/Identity.h"
#include "session/Cancellation.h"
#include "session/Channel.h"

namespace quichat::session {

// Waits until at least one remote peer is visible, then publishes exactly
// one presence envelope for the lifetime of the session.
class PresenceAnnouncer {
public:
    using Interval = std::chrono::steady_clock::duration;
    using OnAnnounced = std::function<void()>;

    static constexpr std::chrono::milliseconds kDefaultInterval{250};

    PresenceAnnouncer(Channel& channel, const chat::Identity& self,
                      Interval interval = kDefaultInterval);

    void set_on_announced(OnAnnounced cb) { on_announced_ = std::move(cb); }

    // Polls until the announcement is out or the token fires. A
    // cancellation before any peer shows up publishes nothing.
    boost::system::error_code run(CancellationToken& token);

    // Single check. Returns true only for the call that published.
    bool poll(boost::system::error_code& ec);

    bool announced() const noexcept { return latched_.load(); }

private:
    Channel& channel_;
    const chat::Identity& self_;
    const Interval interval_;
    OnAnnounced on_announced_;

    std::atomic<bool> latched_{false};
};

} // namespace quichat::session
