#include "networking/RelayProtocol.h"

#include <boost/json.hpp>

namespace quichat::networking {

namespace json = boost::json;

namespace {

std::optional<std::string> string_field(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v || !v->is_string()) return std::nullopt;
    const json::string& s = v->get_string();
    return std::string(s.data(), s.size());
}

} // namespace

std::string encode_welcome(const std::string& peer_id, const std::string& topic) {
    return json::serialize(json::object{
        {"type", "welcome"},
        {"peer_id", peer_id},
        {"topic", topic}
    });
}

std::string encode_data(const std::string& from, const std::string& data) {
    return json::serialize(json::object{
        {"type", "data"},
        {"from", from},
        {"data", data}
    });
}

std::string encode_peers(const std::vector<std::string>& peers) {
    json::array arr;
    for (const auto& p : peers) arr.emplace_back(json::string_view(p.data(), p.size()));
    json::object obj{{"type", "peers"}};
    obj.emplace("peers", std::move(arr));
    return json::serialize(obj);
}

std::optional<RelayFrame> decode_relay_frame(std::string_view bytes) {
    json::error_code ec;
    json::value v = json::parse(json::string_view(bytes.data(), bytes.size()), ec);
    if (ec) return std::nullopt;

    const json::object* obj = v.if_object();
    if (!obj) return std::nullopt;

    auto type = string_field(*obj, "type");
    if (!type) return std::nullopt;

    RelayFrame frame;
    if (*type == "welcome") {
        auto peer_id = string_field(*obj, "peer_id");
        auto topic = string_field(*obj, "topic");
        if (!peer_id || !topic) return std::nullopt;
        frame.type = RelayFrame::Type::Welcome;
        frame.peer_id = std::move(*peer_id);
        frame.topic = std::move(*topic);
    } else if (*type == "data") {
        auto from = string_field(*obj, "from");
        auto data = string_field(*obj, "data");
        if (!from || !data) return std::nullopt;
        frame.type = RelayFrame::Type::Data;
        frame.peer_id = std::move(*from);
        frame.data = std::move(*data);
    } else if (*type == "peers") {
        const json::value* list = obj->if_contains("peers");
        if (!list || !list->is_array()) return std::nullopt;
        frame.type = RelayFrame::Type::Peers;
        for (const json::value& p : list->get_array()) {
            const json::string* s = p.if_string();
            if (!s) return std::nullopt;
            frame.peers.emplace_back(s->data(), s->size());
        }
    } else {
        return std::nullopt;
    }
    return frame;
}

std::string topic_from_target(std::string_view target) {
    std::size_t end = target.find_first_of("?#");
    if (end != std::string_view::npos) target = target.substr(0, end);
    while (!target.empty() && target.front() == '/') target.remove_prefix(1);
    while (!target.empty() && target.back() == '/') target.remove_suffix(1);
    if (target.empty()) return std::string(kDefaultTopic);
    return std::string(target);
}

} // namespace quichat::networking
