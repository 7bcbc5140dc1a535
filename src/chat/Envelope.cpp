#include "chat/Envelope.h"

#include "chat/Classifier.h"

#include <boost/json.hpp>

#include <utility>

namespace quichat::chat {

namespace json = boost::json;

namespace {

std::optional<std::string> string_field(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v) return std::nullopt;
    const json::string* s = v->if_string();
    if (!s) return std::nullopt;
    return std::string(s->data(), s->size());
}

bool is_probe_kind(Envelope::Kind kind) noexcept {
    return kind == Envelope::Kind::Ping || kind == Envelope::Kind::Pong;
}

Envelope stamp(const Identity& self, Envelope::Kind kind, Timestamp now) {
    Envelope env;
    env.kind = kind;
    env.nick = self.nick();
    env.sender = self.instance_id();
    env.sent_at = now;
    return env;
}

} // namespace

const char* kind_name(Envelope::Kind kind) noexcept {
    switch (kind) {
        case Envelope::Kind::Chat: return "chat";
        case Envelope::Kind::Join: return "join";
        case Envelope::Kind::Ping: return "ping";
        case Envelope::Kind::Pong: return "pong";
    }
    return "chat";
}

std::optional<Envelope::Kind> kind_from_name(std::string_view name) noexcept {
    if (name == "chat") return Envelope::Kind::Chat;
    if (name == "join") return Envelope::Kind::Join;
    if (name == "ping") return Envelope::Kind::Ping;
    if (name == "pong") return Envelope::Kind::Pong;
    return std::nullopt;
}

Envelope make_chat(const Identity& self, std::string text, Timestamp now) {
    Envelope env = stamp(self, Envelope::Kind::Chat, now);
    env.text = std::move(text);
    return env;
}

Envelope make_presence(const Identity& self, Timestamp now) {
    Envelope env = stamp(self, Envelope::Kind::Join, now);
    env.text = std::string(kPresenceToken);
    return env;
}

Envelope make_probe(const Identity& self, std::string probe_id, Timestamp now) {
    Envelope env = stamp(self, Envelope::Kind::Ping, now);
    env.text = std::string(kProbePrefix) + probe_id;
    env.probe_id = std::move(probe_id);
    return env;
}

Envelope make_probe_reply(const Identity& self, std::string probe_id, Timestamp now) {
    Envelope env = stamp(self, Envelope::Kind::Pong, now);
    env.text = std::string(kReplyPrefix) + probe_id;
    env.probe_id = std::move(probe_id);
    return env;
}

std::string encode_envelope(const Envelope& env) {
    json::object obj{
        {"kind", kind_name(env.kind)},
        {"nick", env.nick},
        {"sid", env.sender},
        {"text", env.text},
        {"ts", format_rfc3339(env.sent_at)}
    };
    // Probes always carry an id, possibly empty, so they decode as sent.
    if (is_probe_kind(env.kind) || !env.probe_id.empty()) {
        obj.emplace("id", json::string_view(env.probe_id.data(), env.probe_id.size()));
    }
    return json::serialize(obj);
}

std::optional<Envelope> decode_envelope(std::string_view bytes) {
    json::error_code ec;
    json::value v = json::parse(json::string_view(bytes.data(), bytes.size()), ec);
    if (ec) return std::nullopt;

    const json::object* obj = v.if_object();
    if (!obj) return std::nullopt;

    auto nick = string_field(*obj, "nick");
    auto text = string_field(*obj, "text");
    auto ts = string_field(*obj, "ts");
    if (!nick || !text || !ts) return std::nullopt;

    auto sent_at = parse_rfc3339(*ts);
    if (!sent_at) return std::nullopt;

    Envelope env;
    env.nick = std::move(*nick);
    env.text = std::move(*text);
    env.sent_at = *sent_at;

    if (obj->if_contains("sid")) {
        auto sid = string_field(*obj, "sid");
        if (!sid) return std::nullopt;
        env.sender = std::move(*sid);
    }

    if (obj->if_contains("kind")) {
        auto name = string_field(*obj, "kind");
        if (!name) return std::nullopt;
        auto kind = kind_from_name(*name);
        if (!kind) return std::nullopt;
        env.kind = *kind;

        if (obj->if_contains("id")) {
            auto id = string_field(*obj, "id");
            if (!id) return std::nullopt;
            env.probe_id = std::move(*id);
        } else if (is_probe_kind(env.kind)) {
            return std::nullopt;
        }
    } else {
        auto [kind, id] = classify_legacy_text(env.text);
        env.kind = kind;
        env.probe_id = std::move(id);
    }

    return env;
}

} // namespace quichat::chat
