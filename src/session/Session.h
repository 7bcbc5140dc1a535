#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>

#include <boost/system/error_code.hpp>

#include "chat/IDGenerator.hpp"
#include "chat/Identity.h"
#include "chat/ProbeTracker.h"
#include "session/Cancellation.h"
#include "session/Channel.h"
#include "session/Terminal.h"

namespace quichat::session {

struct SessionOptions {
    std::chrono::milliseconds announce_interval{250};
    std::chrono::seconds probe_ttl{0};  // 0 = unanswered probes never expire
};

// One chat session: receiver, sender and presence announcer on their own
// threads, torn down together through a shared cancellation token.
class Session {
public:
    enum class State { Idle, Announcing, Active, Closing, Terminated };

    Session(Channel& channel, Terminal& terminal, chat::Identity self,
            SessionOptions options = {});

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Blocks until all three tasks have exited. Success after /quit or
    // stop(); otherwise the first error that ended a task. A session runs
    // once.
    boost::system::error_code run();

    // External cancellation; safe from any thread.
    void stop();

    State state() const noexcept { return state_.load(); }
    const chat::Identity& identity() const noexcept { return self_; }
    chat::ProbeTracker& probes() noexcept { return probes_; }

private:
    void finish(boost::system::error_code ec);
    void fail(std::exception_ptr error);

    Channel& channel_;
    Terminal& terminal_;
    const chat::Identity self_;
    const SessionOptions options_;

    chat::IDGenerator idgen_;
    chat::ProbeTracker probes_;
    CancellationToken token_;

    std::atomic<State> state_{State::Idle};

    std::mutex mu_;
    boost::system::error_code result_;
    std::exception_ptr exception_;
};

const char* state_name(Session::State state) noexcept;

} // namespace quichat::session
