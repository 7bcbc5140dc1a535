#include "networking/TopicRelay.h"

#include "networking/RelayProtocol.h"

#include <algorithm>
#include <iostream>

namespace quichat::networking {

TopicRelay::TopicRelay(WebSocketServer& server, chat::IDGenerator& idgen, bool verbose)
    : server_(server), idgen_(idgen), verbose_(verbose) {
    server_.set_on_connect([this](ClientId id, const std::string& target) { on_connect(id, target); });
    server_.set_on_disconnect([this](ClientId id) { on_disconnect(id); });
    server_.set_on_message([this](ClientId id, const std::string& msg) { on_message(id, msg); });
}

std::size_t TopicRelay::member_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return members_.size();
}

std::vector<std::string> TopicRelay::peers_in(const std::string& topic) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, m] : members_) {
        if (m.topic == topic) out.push_back(m.peer_id);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void TopicRelay::on_connect(ClientId client, const std::string& target) {
    RelayMember member;
    member.client = client;
    member.peer_id = idgen_.peerID();
    member.topic = topic_from_target(target);

    if (verbose_) {
        std::cout << "[relay] " << member.peer_id << " joined " << member.topic << "\n";
    }

    std::lock_guard<std::mutex> lk(mu_);
    server_.send(client, encode_welcome(member.peer_id, member.topic));
    const std::string topic = member.topic;
    members_.emplace(client, std::move(member));
    push_rosters_locked(topic);
}

void TopicRelay::on_disconnect(ClientId client) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = members_.find(client);
    if (it == members_.end()) return;

    if (verbose_) {
        std::cout << "[relay] " << it->second.peer_id << " left " << it->second.topic << "\n";
    }

    const std::string topic = it->second.topic;
    members_.erase(it);
    push_rosters_locked(topic);
}

void TopicRelay::on_message(ClientId client, const std::string& payload) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = members_.find(client);
    if (it == members_.end()) return;

    const RelayMember& sender = it->second;

    const std::string frame = encode_data(sender.peer_id, payload);
    for (const auto& [id, m] : members_) {
        if (m.topic == sender.topic) server_.send(id, frame);
    }
}

void TopicRelay::push_rosters_locked(const std::string& topic) {
    std::vector<const RelayMember*> in_topic;
    for (const auto& [id, m] : members_) {
        if (m.topic == topic) in_topic.push_back(&m);
    }

    for (const RelayMember* to : in_topic) {
        std::vector<std::string> others;
        for (const RelayMember* m : in_topic) {
            if (m != to) others.push_back(m->peer_id);
        }
        std::sort(others.begin(), others.end());
        server_.send(to->client, encode_peers(others));
    }
}

} // namespace quichat::networking
