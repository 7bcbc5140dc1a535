#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include <boost/system/error_code.hpp>

#include "session/Cancellation.h"
#include "session/Errors.h"

namespace quichat::session {

// Multi-producer queue with a blocking, cancelable pop. Once closed, the
// remaining items drain and then pop reports channel_closed.
template <typename T>
class MessageQueue {
public:
    MessageQueue() = default;

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return items_.size();
    }

    std::optional<T> pop(CancellationToken& token, boost::system::error_code& ec) {
        CancellationToken::Registration wake(token, [this] {
            std::lock_guard<std::mutex> lk(mu_);
            cv_.notify_all();
        });

        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&] { return token.cancelled() || !items_.empty() || closed_; });

        if (token.cancelled()) {
            ec = errc::cancelled;
            return std::nullopt;
        }
        if (items_.empty()) {
            ec = errc::channel_closed;
            return std::nullopt;
        }
        ec = {};
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace quichat::session
