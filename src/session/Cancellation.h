#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace quichat::session {

// One-shot cancellation signal shared by every task of a session.
// Blocking primitives either wait on it directly (wait_for) or register a
// callback that wakes them when cancel() fires.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    // RAII callback registration. The callback runs at most once, on the
    // thread calling cancel(), or inline when the token is already
    // cancelled. Destroying a registration waits for an in-flight callback.
    class Registration {
    public:
        Registration(CancellationToken& token, Callback cb);
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        CancellationToken& token_;
        std::uint64_t id_ = 0;
    };

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    // Returns true when cancelled before the timeout elapsed.
    bool wait_for(std::chrono::steady_clock::duration timeout);

private:
    std::uint64_t add_callback(Callback cb);
    void remove_callback(std::uint64_t id);

    std::atomic<bool> cancelled_{false};

    std::mutex mu_;
    std::condition_variable cv_;
    std::map<std::uint64_t, Callback> callbacks_;
    std::uint64_t next_id_ = 1;

    // Held while callbacks run so removal can wait for them.
    std::mutex invoke_mu_;
};

} // namespace quichat::session
