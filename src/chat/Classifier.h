#pragma once

#include <string>
#include <string_view>
#include <utility>

#include "chat/Envelope.h"
#include "chat/Identity.h"

namespace quichat::chat {

enum class ControlKind { Chat, Presence, Probe, ProbeReply };

struct Classification {
    ControlKind kind = ControlKind::Chat;
    std::string payload;  // chat text, or the probe id for Probe / ProbeReply
    bool is_local = false;
};

Classification classify(const Envelope& env, const Identity& self);

// Prefix sniffing for envelopes that carry no explicit kind.
std::pair<Envelope::Kind, std::string> classify_legacy_text(std::string_view text);

} // namespace quichat::chat
