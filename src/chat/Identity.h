#pragma once

#include <cstddef>
#include <string>

#include "chat/IDGenerator.hpp"

namespace quichat::chat {

// Who this session is. The nick is for display only; local-origin checks
// compare instance ids so two peers sharing a nick stay distinguishable.
class Identity {
public:
    static constexpr std::size_t kMaxNickLen = 24;

    // Main constructor: generates inst-<id>
    Identity(IDGenerator& idgen, std::string nick);

    // Restore from an existing instance id (tests / replays)
    Identity(std::string instance_id, std::string nick);

    const std::string& nick() const noexcept;
    const std::string& instance_id() const noexcept;

    bool is_self(const std::string& sender) const noexcept;

    static std::string sanitize_nick(std::string s);

private:
    static std::string trim_copy(std::string s);
    static bool is_space(char c) noexcept;

private:
    std::string instance_id_;
    std::string nick_;
};

} // namespace quichat::chat
