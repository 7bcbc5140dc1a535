#include "chat/Identity.h"

#include <utility>

namespace quichat::chat {

Identity::Identity(IDGenerator& idgen, std::string nick) : instance_id_(idgen.instanceID()),
        nick_(sanitize_nick(std::move(nick))) {}

Identity::Identity(std::string instance_id, std::string nick) : instance_id_(std::move(instance_id)),
        nick_(sanitize_nick(std::move(nick))) {}

const std::string& Identity::nick() const noexcept { return nick_; }
const std::string& Identity::instance_id() const noexcept { return instance_id_; }

bool Identity::is_self(const std::string& sender) const noexcept {
    return !sender.empty() && sender == instance_id_;
}

bool Identity::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string Identity::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

std::string Identity::sanitize_nick(std::string s) {
    s = trim_copy(std::move(s));

    if (s.size() > kMaxNickLen) {
        s.resize(kMaxNickLen);
        s = trim_copy(std::move(s));
    }

    if (s.empty()) s = "anon";
    return s;
}

} // namespace quichat::chat
