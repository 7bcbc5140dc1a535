#pragma once

#include <string>
#include <vector>

#include <boost/system/error_code.hpp>

#include "session/Cancellation.h"

namespace quichat::session {

// The broadcast pub/sub topic a session talks over. Every published
// payload is delivered to every subscriber, the publisher included.
class Channel {
public:
    virtual ~Channel() = default;

    virtual void publish(const std::string& payload, boost::system::error_code& ec) = 0;

    // Blocks for the next payload. Fails with errc::cancelled when the
    // token fires and errc::channel_closed once the channel is gone.
    virtual std::string next(CancellationToken& token, boost::system::error_code& ec) = 0;

    // Remote peers currently on the topic, not including ourselves.
    virtual std::vector<std::string> list_peers() const = 0;
};

} // namespace quichat::session
