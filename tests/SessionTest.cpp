#include <gtest/gtest.h>

#include "Fakes.h"
#include "session/Session.h"

#include <chrono>
#include <stdexcept>
#include <thread>

using namespace quichat;
using namespace quichat::fakes;
using State = session::Session::State;

namespace {

session::SessionOptions fast_options() {
    session::SessionOptions opts;
    opts.announce_interval = 5ms;
    return opts;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(2ms);
    }
    return true;
}

// Runs a session on its own thread so the test can drive it.
class Running {
public:
    explicit Running(session::Session& s) : thread_([this, &s] { result_ = s.run(); }) {}
    ~Running() {
        if (thread_.joinable()) thread_.join();
    }

    boost::system::error_code join() {
        thread_.join();
        return result_;
    }

private:
    boost::system::error_code result_;
    std::thread thread_;
};

} // namespace

TEST(Session, QuitEndsWithSuccess) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());
    EXPECT_EQ(s.state(), State::Idle);

    terminal.feed("/quit");
    EXPECT_FALSE(s.run());
    EXPECT_EQ(s.state(), State::Terminated);

    auto printed = terminal.printed();
    ASSERT_FALSE(printed.empty());
    EXPECT_NE(printed.front().find("*** alice joined the chat ***"), std::string::npos);
    EXPECT_TRUE(terminal.printed_containing("Bye!"));
}

TEST(Session, RunsOnlyOnce) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());
    terminal.feed("/quit");
    EXPECT_FALSE(s.run());
    EXPECT_THROW(s.run(), std::logic_error);
}

TEST(Session, EndOfInputIsReported) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());
    terminal.feed_eof();
    EXPECT_EQ(s.run(), session::errc::end_of_input);
}

TEST(Session, ClosedChannelIsReported) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());
    channel.close();
    EXPECT_EQ(s.run(), session::errc::channel_closed);
    EXPECT_EQ(s.state(), State::Terminated);
}

TEST(Session, StopFromAnotherThread) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());

    Running running(s);
    ASSERT_TRUE(eventually([&] { return s.state() == State::Announcing; }));
    s.stop();
    EXPECT_FALSE(running.join());
    EXPECT_TRUE(channel.published().empty());
}

TEST(Session, BecomesActiveOnceAnnounced) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());

    Running running(s);
    ASSERT_TRUE(eventually([&] { return s.state() == State::Announcing; }));
    channel.set_peers({"peer-b"});
    ASSERT_TRUE(eventually([&] { return s.state() == State::Active; }));

    // the announcer is done but the session keeps going
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(s.state(), State::Active);

    terminal.feed("/quit");
    EXPECT_FALSE(running.join());
    EXPECT_EQ(channel.published().size(), 1u);
}

TEST(Session, MalformedDataDoesNotEndSession) {
    FakeChannel channel;
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());
    chat::Identity bob("inst-b", "bob");

    Running running(s);
    channel.deliver("{{{");
    channel.deliver(chat::encode_envelope(chat::make_chat(bob, "still here", std::chrono::system_clock::now())));
    EXPECT_TRUE(terminal.wait_for_print("still here"));

    terminal.feed("/quit");
    EXPECT_FALSE(running.join());
}

TEST(Session, ChatEchoRendersOnce) {
    FakeChannel channel;
    channel.set_loopback(true);
    FakeTerminal terminal;
    session::Session s(channel, terminal, chat::Identity("inst-a", "alice"), fast_options());

    Running running(s);
    terminal.feed("hello");
    EXPECT_TRUE(terminal.wait_for_print("» hello"));
    EXPECT_EQ(terminal.retracts(), 1u);

    terminal.feed("/quit");
    EXPECT_FALSE(running.join());
}

TEST(Session, TwoPeersChatAndPing) {
    FakeBus bus;
    auto& a = bus.join("peer-a");
    auto& b = bus.join("peer-b");
    FakeTerminal alice_term;
    FakeTerminal bob_term;
    session::Session alice(a, alice_term, chat::Identity("inst-a", "alice"), fast_options());
    session::Session bob(b, bob_term, chat::Identity("inst-b", "bob"), fast_options());

    Running alice_run(alice);
    Running bob_run(bob);

    EXPECT_TRUE(bob_term.wait_for_print("alice joined the chat"));
    EXPECT_TRUE(alice_term.wait_for_print("bob joined the chat"));

    alice_term.feed("hello bob");
    EXPECT_TRUE(bob_term.wait_for_print("» hello bob"));
    EXPECT_TRUE(alice_term.wait_for_print("» hello bob"));

    alice_term.feed("/ping");
    EXPECT_TRUE(alice_term.wait_for_print("Pong from bob: "));
    EXPECT_FALSE(bob_term.printed_containing("Pong from"));
    EXPECT_TRUE(eventually([&] { return alice.probes().outstanding() == 0; }));

    alice_term.feed("/quit");
    bob_term.feed("/quit");
    EXPECT_FALSE(alice_run.join());
    EXPECT_FALSE(bob_run.join());
}

TEST(Session, SameNickDifferentInstancesStillAnswerEachOther) {
    FakeBus bus;
    auto& a = bus.join("peer-a");
    auto& b = bus.join("peer-b");
    FakeTerminal term_a;
    FakeTerminal term_b;
    session::Session first(a, term_a, chat::Identity("inst-1", "sam"), fast_options());
    session::Session second(b, term_b, chat::Identity("inst-2", "sam"), fast_options());

    Running run_a(first);
    Running run_b(second);

    EXPECT_TRUE(eventually([&] { return first.state() == State::Active && second.state() == State::Active; }));
    term_a.feed("/ping");
    EXPECT_TRUE(term_a.wait_for_print("Pong from sam: "));

    term_a.feed("/quit");
    term_b.feed("/quit");
    EXPECT_FALSE(run_a.join());
    EXPECT_FALSE(run_b.join());
}

TEST(Session, StateNames) {
    EXPECT_STREQ(session::state_name(State::Idle), "idle");
    EXPECT_STREQ(session::state_name(State::Announcing), "announcing");
    EXPECT_STREQ(session::state_name(State::Active), "active");
    EXPECT_STREQ(session::state_name(State::Closing), "closing");
    EXPECT_STREQ(session::state_name(State::Terminated), "terminated");
}
