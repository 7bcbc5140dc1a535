#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chat/IDGenerator.hpp"
#include "networking/RelayMember.hpp"
#include "networking/WebSocketServer.h"

namespace quichat::networking {

// Broadcast hub on top of WebSocketServer. Every connection joins the
// topic named by its request target; each payload is fanned out to all
// members of that topic, publisher included, and every membership change
// pushes each member the roster of the others.
class TopicRelay {
public:
    TopicRelay(WebSocketServer& server, chat::IDGenerator& idgen, bool verbose = false);

    TopicRelay(const TopicRelay&) = delete;
    TopicRelay& operator=(const TopicRelay&) = delete;

    std::size_t member_count() const;
    std::vector<std::string> peers_in(const std::string& topic) const;

private:
    void on_connect(ClientId client, const std::string& target);
    void on_disconnect(ClientId client);
    void on_message(ClientId client, const std::string& payload);

    // Caller holds mu_.
    void push_rosters_locked(const std::string& topic);

    WebSocketServer& server_;
    chat::IDGenerator& idgen_;
    const bool verbose_;

    mutable std::mutex mu_;
    std::unordered_map<ClientId, RelayMember> members_;
};

} // namespace quichat::networking
