#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

#include "session/Cancellation.h"

namespace quichat::session {

// Owns the threads of one session. Leaving scope with tasks still running
// (a failed spawn, an exception) cancels the token and joins them, so no
// joinable std::thread is ever destroyed.
class TaskGroup {
public:
    explicit TaskGroup(CancellationToken& token) : token_(token) {}
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Throws std::system_error when the thread cannot be started.
    void spawn(std::function<void()> task);

    // Waits for every task without cancelling.
    void join();

    std::size_t size() const noexcept { return threads_.size(); }

private:
    CancellationToken& token_;
    std::vector<std::thread> threads_;
};

} // namespace quichat::session
