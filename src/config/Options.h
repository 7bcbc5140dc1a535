#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace quichat::config {

struct ClientOptions {
    std::string relay_host = "127.0.0.1";
    std::string relay_port = "9002";
    std::string topic = "quichat:global";
    std::string nick = "anon";
    std::chrono::milliseconds announce_interval{250};
    std::chrono::seconds probe_ttl{0};
    bool show_help = false;
};

struct RelayOptions {
    unsigned short port = 9002;
    bool verbose = false;
    bool show_help = false;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Both throw UsageError on unknown flags or bad values.
ClientOptions parse_client_options(int argc, char* argv[]);
RelayOptions parse_relay_options(int argc, char* argv[]);

std::string client_usage(const char* argv0);
std::string relay_usage(const char* argv0);

// "host:port", "[v6]:port", "host" (default port kept).
void split_host_port(const std::string& spec, std::string& host, std::string& port);

} // namespace quichat::config
