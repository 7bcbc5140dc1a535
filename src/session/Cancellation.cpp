#include "session/Cancellation.h"

#include <utility>

namespace quichat::session {

CancellationToken::Registration::Registration(CancellationToken& token, Callback cb)
    : token_(token), id_(token.add_callback(std::move(cb))) {}

CancellationToken::Registration::~Registration() {
    if (id_ != 0) token_.remove_callback(id_);
}

void CancellationToken::cancel() {
    std::map<std::uint64_t, Callback> pending;
    std::unique_lock<std::mutex> invoking(invoke_mu_, std::defer_lock);
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (cancelled_.load(std::memory_order_relaxed)) return;
        cancelled_.store(true, std::memory_order_release);
        pending.swap(callbacks_);
        invoking.lock();
    }
    cv_.notify_all();

    for (auto& [id, cb] : pending) {
        if (cb) cb();
    }
}

bool CancellationToken::wait_for(std::chrono::steady_clock::duration timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, timeout, [this] { return cancelled(); });
}

std::uint64_t CancellationToken::add_callback(Callback cb) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!cancelled()) {
            const std::uint64_t id = next_id_++;
            callbacks_.emplace(id, std::move(cb));
            return id;
        }
    }
    if (cb) cb();
    return 0;
}

void CancellationToken::remove_callback(std::uint64_t id) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (callbacks_.erase(id) != 0) return;
    }
    // Already handed to cancel(); wait until it has finished running.
    std::lock_guard<std::mutex> invoking(invoke_mu_);
}

} // namespace quichat::session
