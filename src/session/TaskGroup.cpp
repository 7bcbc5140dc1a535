#include "session/TaskGroup.h"

#include <utility>

namespace quichat::session {

TaskGroup::~TaskGroup() {
    for (const auto& t : threads_) {
        if (t.joinable()) {
            token_.cancel();
            break;
        }
    }
    join();
}

void TaskGroup::spawn(std::function<void()> task) {
    threads_.reserve(threads_.size() + 1);
    threads_.emplace_back(std::move(task));
}

void TaskGroup::join() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

} // namespace quichat::session
