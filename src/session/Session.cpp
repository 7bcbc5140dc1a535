#include "session/Session.h"

#include "session/Errors.h"
#include "session/PresenceAnnouncer.h"
#include "session/Receiver.h"
#include "session/Render.h"
#include "session/Sender.h"
#include "session/TaskGroup.h"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace quichat::session {

Session::Session(Channel& channel, Terminal& terminal, chat::Identity self, SessionOptions options)
    : channel_(channel),
      terminal_(terminal),
      self_(std::move(self)),
      options_(options),
      probes_(options.probe_ttl) {}

boost::system::error_code Session::run() {
    State expected = State::Idle;
    if (!state_.compare_exchange_strong(expected, State::Announcing)) {
        throw std::logic_error("session already started");
    }

    terminal_.print(render_join(self_.nick()));

    Receiver receiver(channel_, terminal_, probes_, self_);
    Sender sender(channel_, terminal_, probes_, self_, idgen_, token_);
    PresenceAnnouncer announcer(channel_, self_, options_.announce_interval);
    announcer.set_on_announced([this] {
        State s = State::Announcing;
        state_.compare_exchange_strong(s, State::Active);
    });

    TaskGroup tasks(token_);
    try {
        tasks.spawn([&] {
            try {
                finish(receiver.run(token_));
            } catch (...) {
                fail(std::current_exception());
            }
        });
        tasks.spawn([&] {
            try {
                finish(sender.run());
            } catch (...) {
                fail(std::current_exception());
            }
        });
        tasks.spawn([&] {
            try {
                // A finished announcer is not the end of the session.
                auto ec = announcer.run(token_);
                if (ec) finish(ec);
            } catch (...) {
                fail(std::current_exception());
            }
        });
    } catch (const std::system_error&) {
        finish({});
        tasks.join();
        state_.store(State::Terminated);
        throw;
    }

    tasks.join();

    state_.store(State::Terminated);

    std::lock_guard<std::mutex> lk(mu_);
    if (exception_) std::rethrow_exception(exception_);
    return result_;
}

void Session::stop() {
    finish({});
}

void Session::finish(boost::system::error_code ec) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        // Errors caused by the cancellation itself are not the cause.
        if (ec && ec != errc::cancelled && !result_ && !token_.cancelled()) result_ = ec;
    }

    State s = state_.load();
    while ((s == State::Announcing || s == State::Active) &&
           !state_.compare_exchange_weak(s, State::Closing)) {
    }

    token_.cancel();
}

void Session::fail(std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!exception_) exception_ = std::move(error);
    }
    finish({});
}

const char* state_name(Session::State state) noexcept {
    switch (state) {
        case Session::State::Idle:       return "idle";
        case Session::State::Announcing: return "announcing";
        case Session::State::Active:     return "active";
        case Session::State::Closing:    return "closing";
        case Session::State::Terminated: return "terminated";
    }
    return "unknown";
}

} // namespace quichat::session
