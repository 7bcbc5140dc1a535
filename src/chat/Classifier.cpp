#include "chat/Classifier.h"

namespace quichat::chat {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

Classification classify(const Envelope& env, const Identity& self) {
    Classification out;
    out.is_local = self.is_self(env.sender);

    switch (env.kind) {
        case Envelope::Kind::Chat:
            out.kind = ControlKind::Chat;
            out.payload = env.text;
            break;
        case Envelope::Kind::Join:
            out.kind = ControlKind::Presence;
            break;
        case Envelope::Kind::Ping:
            out.kind = ControlKind::Probe;
            out.payload = env.probe_id;
            break;
        case Envelope::Kind::Pong:
            out.kind = ControlKind::ProbeReply;
            out.payload = env.probe_id;
            break;
    }
    return out;
}

std::pair<Envelope::Kind, std::string> classify_legacy_text(std::string_view text) {
    if (text == kPresenceToken) return {Envelope::Kind::Join, std::string()};
    if (starts_with(text, kProbePrefix)) {
        return {Envelope::Kind::Ping, std::string(text.substr(kProbePrefix.size()))};
    }
    if (starts_with(text, kReplyPrefix)) {
        return {Envelope::Kind::Pong, std::string(text.substr(kReplyPrefix.size()))};
    }
    return {Envelope::Kind::Chat, std::string()};
}

} // namespace quichat::chat
