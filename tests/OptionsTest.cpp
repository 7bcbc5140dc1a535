#include <gtest/gtest.h>

#include "config/Options.h"

#include <string>
#include <vector>

using namespace quichat::config;

namespace {

// getopt wants mutable argv
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> storage;
    std::vector<char*> ptrs;
};

} // namespace

TEST(Options, ClientDefaults) {
    Argv a({"quichat"});
    auto opts = parse_client_options(a.argc(), a.argv());
    EXPECT_EQ(opts.relay_host, "127.0.0.1");
    EXPECT_EQ(opts.relay_port, "9002");
    EXPECT_EQ(opts.topic, "quichat:global");
    EXPECT_EQ(opts.nick, "anon");
    EXPECT_EQ(opts.announce_interval.count(), 250);
    EXPECT_EQ(opts.probe_ttl.count(), 0);
    EXPECT_FALSE(opts.show_help);
}

TEST(Options, ClientFlags) {
    Argv a({"quichat", "--relay", "chat.example:4001", "--nick", "bob", "-t", "room",
            "--announce-interval", "100", "--probe-ttl=30"});
    auto opts = parse_client_options(a.argc(), a.argv());
    EXPECT_EQ(opts.relay_host, "chat.example");
    EXPECT_EQ(opts.relay_port, "4001");
    EXPECT_EQ(opts.nick, "bob");
    EXPECT_EQ(opts.topic, "room");
    EXPECT_EQ(opts.announce_interval.count(), 100);
    EXPECT_EQ(opts.probe_ttl.count(), 30);
}

TEST(Options, ClientRejectsBadValues) {
    Argv bad_port({"quichat", "--relay", "host:99999"});
    EXPECT_THROW(parse_client_options(bad_port.argc(), bad_port.argv()), UsageError);

    Argv bad_flag({"quichat", "--bogus"});
    EXPECT_THROW(parse_client_options(bad_flag.argc(), bad_flag.argv()), UsageError);

    Argv bad_interval({"quichat", "-a", "fast"});
    EXPECT_THROW(parse_client_options(bad_interval.argc(), bad_interval.argv()), UsageError);

    Argv stray({"quichat", "extra"});
    EXPECT_THROW(parse_client_options(stray.argc(), stray.argv()), UsageError);
}

TEST(Options, HostPortForms) {
    std::string host, port = "9002";
    split_host_port("[::1]:4001", host, port);
    EXPECT_EQ(host, "::1");
    EXPECT_EQ(port, "4001");

    port = "9002";
    split_host_port("relay.local", host, port);
    EXPECT_EQ(host, "relay.local");
    EXPECT_EQ(port, "9002");

    EXPECT_THROW(split_host_port(":4001", host, port), UsageError);
}

TEST(Options, RelayFlags) {
    Argv a({"quichat-relay", "-p", "0", "--verbose"});
    auto opts = parse_relay_options(a.argc(), a.argv());
    EXPECT_EQ(opts.port, 0);
    EXPECT_TRUE(opts.verbose);

    Argv h({"quichat-relay", "--help"});
    EXPECT_TRUE(parse_relay_options(h.argc(), h.argv()).show_help);
}
