#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quichat::networking {

inline constexpr std::string_view kDefaultTopic = "quichat:global";
inline constexpr unsigned short kDefaultRelayPort = 9002;

// Relay -> client frames. Client -> relay frames are the raw payload.
struct RelayFrame {
    enum class Type { Welcome, Data, Peers };

    Type type = Type::Data;
    std::string peer_id;  // Welcome: the receiver's id, Data: the publisher's
    std::string topic;    // Welcome only
    std::string data;     // Data only
    std::vector<std::string> peers;  // Peers only
};

std::string encode_welcome(const std::string& peer_id, const std::string& topic);
std::string encode_data(const std::string& from, const std::string& data);
std::string encode_peers(const std::vector<std::string>& peers);

std::optional<RelayFrame> decode_relay_frame(std::string_view bytes);

// "/room?x=1" -> "room"; empty path -> kDefaultTopic.
std::string topic_from_target(std::string_view target);

} // namespace quichat::networking
