#pragma once
#include <string>

#include "networking/WebSocketServer.h"

namespace quichat::networking {

struct RelayMember {
    ClientId client = 0;
    std::string peer_id;  // "peer-<ulid>"
    std::string topic;
};

} // namespace quichat::networking
