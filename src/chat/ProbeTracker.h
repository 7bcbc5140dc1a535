#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace quichat::chat {

// Outstanding latency probes keyed by probe id. Shared by the sender
// (record on /ping) and the receiver (resolve on a matching reply).
class ProbeTracker {
public:
    using Clock = std::chrono::steady_clock;

    // ttl == 0 keeps unanswered probes forever.
    explicit ProbeTracker(Clock::duration ttl = Clock::duration::zero());

    ProbeTracker(const ProbeTracker&) = delete;
    ProbeTracker& operator=(const ProbeTracker&) = delete;

    // Also sweeps expired records when a ttl is set.
    void record(const std::string& id, Clock::time_point sent_at);

    // Looks up, removes and returns the elapsed time; empty when unknown.
    std::optional<Clock::duration> resolve(const std::string& id, Clock::time_point now);

    std::size_t expire(Clock::time_point now);

    std::size_t outstanding() const;
    bool contains(const std::string& id) const;
    Clock::duration ttl() const noexcept { return ttl_; }

private:
    std::size_t expire_locked(Clock::time_point now);

    const Clock::duration ttl_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, Clock::time_point> pending_;
};

} // namespace quichat::chat
