#include <gtest/gtest.h>

#include "Fakes.h"
#include "session/Sender.h"

#include <thread>

using namespace quichat;
using namespace quichat::fakes;
using Outcome = session::Sender::Outcome;

namespace {

class SenderTest : public ::testing::Test {
protected:
    SenderTest()
        : self_("inst-self", "alice"),
          sender_(channel_, terminal_, probes_, self_, idgen_, token_) {}

    Outcome line(const std::string& text) {
        boost::system::error_code ec;
        Outcome out = sender_.handle_line(text, ec);
        last_ec_ = ec;
        return out;
    }

    chat::Identity self_;
    chat::IDGenerator idgen_;
    chat::ProbeTracker probes_;
    session::CancellationToken token_;
    FakeChannel channel_;
    FakeTerminal terminal_;
    session::Sender sender_;
    boost::system::error_code last_ec_;
};

} // namespace

TEST_F(SenderTest, PublishesChatAndRetractsEcho) {
    EXPECT_EQ(line("hello world"), Outcome::Continue);
    EXPECT_FALSE(last_ec_);

    auto sent = channel_.published_envelopes();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].kind, chat::Envelope::Kind::Chat);
    EXPECT_EQ(sent[0].text, "hello world");
    EXPECT_EQ(sent[0].nick, "alice");
    EXPECT_EQ(sent[0].sender, "inst-self");
    EXPECT_EQ(terminal_.retracts(), 1u);
    EXPECT_TRUE(terminal_.printed().empty());
}

TEST_F(SenderTest, IgnoresEmptyLine) {
    EXPECT_EQ(line(""), Outcome::Continue);
    EXPECT_TRUE(channel_.published().empty());
    EXPECT_EQ(terminal_.retracts(), 0u);
}

TEST_F(SenderTest, ListPrintsPeers) {
    channel_.set_peers({"peer-b", "peer-c"});
    EXPECT_EQ(line("/list"), Outcome::Continue);
    EXPECT_TRUE(terminal_.printed_containing("Peers (2): [peer-b peer-c]"));
    EXPECT_TRUE(channel_.published().empty());
}

TEST_F(SenderTest, PingRecordsAndPublishesProbe) {
    EXPECT_EQ(line("/ping"), Outcome::Continue);
    EXPECT_FALSE(last_ec_);

    auto sent = channel_.published_envelopes();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].kind, chat::Envelope::Kind::Ping);
    EXPECT_FALSE(sent[0].probe_id.empty());
    EXPECT_TRUE(probes_.contains(sent[0].probe_id));
}

TEST_F(SenderTest, HelpPrintsCommandList) {
    EXPECT_EQ(line("/help"), Outcome::Continue);
    EXPECT_TRUE(terminal_.printed_containing("Available commands:"));
    EXPECT_TRUE(channel_.published().empty());
}

TEST_F(SenderTest, QuitCancelsSession) {
    EXPECT_EQ(line("/quit"), Outcome::Quit);
    EXPECT_FALSE(last_ec_);
    EXPECT_TRUE(token_.cancelled());
    EXPECT_TRUE(terminal_.printed_containing("Bye!"));
    EXPECT_TRUE(channel_.published().empty());
}

TEST_F(SenderTest, UnknownCommandIsReported) {
    EXPECT_EQ(line("/dance"), Outcome::Continue);
    EXPECT_TRUE(terminal_.printed_containing("Unknown command: dance"));
    EXPECT_TRUE(channel_.published().empty());
}

TEST_F(SenderTest, PublishFailureIsReported) {
    channel_.set_fail_publish(true);
    line("hello");
    EXPECT_EQ(last_ec_, session::errc::publish_failed);
}

TEST_F(SenderTest, RunSkipsInterruptsUntilQuit) {
    terminal_.feed_interrupt();
    terminal_.feed("hi");
    terminal_.feed("/quit");
    terminal_.feed("never sent");

    EXPECT_FALSE(sender_.run());
    EXPECT_EQ(channel_.published().size(), 1u);
    EXPECT_TRUE(token_.cancelled());
}

TEST_F(SenderTest, RunEndsAtEndOfInput) {
    terminal_.feed("hi");
    terminal_.feed_eof();

    EXPECT_EQ(sender_.run(), session::errc::end_of_input);
    EXPECT_EQ(channel_.published().size(), 1u);
}

TEST_F(SenderTest, RunEndsOnPublishFailure) {
    channel_.set_fail_publish(true);
    terminal_.feed("hi");
    EXPECT_EQ(sender_.run(), session::errc::publish_failed);
}

TEST_F(SenderTest, RunStopsOnCancel) {
    boost::system::error_code result;
    std::thread runner([&] { result = sender_.run(); });

    std::this_thread::sleep_for(20ms);
    token_.cancel();
    runner.join();
    EXPECT_EQ(result, session::errc::cancelled);
}
