#include "chat/ProbeTracker.h"

namespace quichat::chat {

ProbeTracker::ProbeTracker(Clock::duration ttl) : ttl_(ttl) {}

void ProbeTracker::record(const std::string& id, Clock::time_point sent_at) {
    std::lock_guard<std::mutex> lk(mu_);
    expire_locked(sent_at);
    pending_[id] = sent_at;
}

std::optional<ProbeTracker::Clock::duration>
ProbeTracker::resolve(const std::string& id, Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = pending_.find(id);
    if (it == pending_.end()) return std::nullopt;

    const Clock::time_point sent_at = it->second;
    pending_.erase(it);

    if (now < sent_at) return Clock::duration::zero();
    return now - sent_at;
}

std::size_t ProbeTracker::expire(Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mu_);
    return expire_locked(now);
}

std::size_t ProbeTracker::expire_locked(Clock::time_point now) {
    if (ttl_ <= Clock::duration::zero()) return 0;

    std::size_t removed = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (now - it->second > ttl_) {
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t ProbeTracker::outstanding() const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.size();
}

bool ProbeTracker::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return pending_.count(id) != 0;
}

} // namespace quichat::chat
