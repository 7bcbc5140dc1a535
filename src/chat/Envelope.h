#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "chat/Identity.h"
#include "chat/Timestamp.h"

namespace quichat::chat {

// Legacy in-text control encoding. Still written into `text` so peers that
// only sniff prefixes keep working; our own decoding trusts `kind`.
inline constexpr std::string_view kPresenceToken = "__JOIN__";
inline constexpr std::string_view kProbePrefix   = "__PING__";
inline constexpr std::string_view kReplyPrefix   = "__PONG__";

struct Envelope {
    enum class Kind { Chat, Join, Ping, Pong };

    Kind kind = Kind::Chat;
    std::string nick;
    std::string sender;    // per-session instance id of the publisher
    std::string text;
    std::string probe_id;  // Ping / Pong only
    Timestamp sent_at{};

    friend bool operator==(const Envelope& a, const Envelope& b) {
        return a.kind == b.kind && a.nick == b.nick && a.sender == b.sender &&
               a.text == b.text && a.probe_id == b.probe_id && a.sent_at == b.sent_at;
    }
    friend bool operator!=(const Envelope& a, const Envelope& b) { return !(a == b); }
};

const char* kind_name(Envelope::Kind kind) noexcept;
std::optional<Envelope::Kind> kind_from_name(std::string_view name) noexcept;

Envelope make_chat(const Identity& self, std::string text, Timestamp now);
Envelope make_presence(const Identity& self, Timestamp now);
Envelope make_probe(const Identity& self, std::string probe_id, Timestamp now);
Envelope make_probe_reply(const Identity& self, std::string probe_id, Timestamp now);

// {"kind":..,"nick":..,"sid":..,"text":..,"id":..,"ts":..}
std::string encode_envelope(const Envelope& env);

// Empty on any malformed input; never throws.
std::optional<Envelope> decode_envelope(std::string_view bytes);

} // namespace quichat::chat
