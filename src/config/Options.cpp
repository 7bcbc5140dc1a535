#include "config/Options.h"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace quichat::config {

namespace {

long parse_number(const char* flag, const char* text, long min, long max) {
    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v < min || v > max) {
        throw UsageError(std::string("invalid value for --") + flag + ": " + text);
    }
    return v;
}

} // namespace

void split_host_port(const std::string& spec, std::string& host, std::string& port) {
    if (spec.empty()) throw UsageError("empty relay address");

    if (spec.front() == '[') {
        const auto close = spec.find(']');
        if (close == std::string::npos) throw UsageError("bad relay address: " + spec);
        host = spec.substr(1, close - 1);
        if (close + 1 < spec.size()) {
            if (spec[close + 1] != ':') throw UsageError("bad relay address: " + spec);
            port = spec.substr(close + 2);
        }
    } else {
        const auto colon = spec.rfind(':');
        if (colon == std::string::npos) {
            host = spec;
        } else {
            host = spec.substr(0, colon);
            port = spec.substr(colon + 1);
        }
    }

    if (host.empty()) throw UsageError("bad relay address: " + spec);
    parse_number("relay", port.c_str(), 1, 65535);
}

ClientOptions parse_client_options(int argc, char* argv[]) {
    static const option long_opts[] = {
        {"relay",             required_argument, nullptr, 'r'},
        {"topic",             required_argument, nullptr, 't'},
        {"nick",              required_argument, nullptr, 'n'},
        {"announce-interval", required_argument, nullptr, 'a'},
        {"probe-ttl",         required_argument, nullptr, 'p'},
        {"help",              no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    ClientOptions opts;
    optind = 0;  // glibc: full rescan, so repeated calls behave
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "r:t:n:a:p:h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'r':
                split_host_port(optarg, opts.relay_host, opts.relay_port);
                break;
            case 't':
                opts.topic = optarg;
                if (opts.topic.empty()) throw UsageError("topic must not be empty");
                break;
            case 'n':
                opts.nick = optarg;
                break;
            case 'a':
                opts.announce_interval = std::chrono::milliseconds(
                    parse_number("announce-interval", optarg, 10, 60'000));
                break;
            case 'p':
                opts.probe_ttl = std::chrono::seconds(
                    parse_number("probe-ttl", optarg, 0, std::numeric_limits<int>::max()));
                break;
            case 'h':
                opts.show_help = true;
                break;
            default:
                throw UsageError(std::string("unknown option: ") +
                                 (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
    }
    if (optind < argc) throw UsageError(std::string("unexpected argument: ") + argv[optind]);
    return opts;
}

RelayOptions parse_relay_options(int argc, char* argv[]) {
    static const option long_opts[] = {
        {"port",    required_argument, nullptr, 'p'},
        {"verbose", no_argument,       nullptr, 'v'},
        {"help",    no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    RelayOptions opts;
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "p:vh", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'p':
                opts.port = static_cast<unsigned short>(parse_number("port", optarg, 0, 65535));
                break;
            case 'v':
                opts.verbose = true;
                break;
            case 'h':
                opts.show_help = true;
                break;
            default:
                throw UsageError(std::string("unknown option: ") +
                                 (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
    }
    if (optind < argc) throw UsageError(std::string("unexpected argument: ") + argv[optind]);
    return opts;
}

std::string client_usage(const char* argv0) {
    return std::string("Usage: ") + argv0 + " [options]\n"
        "  -r, --relay HOST:PORT          relay to connect to (default 127.0.0.1:9002)\n"
        "  -t, --topic NAME               topic to join (default quichat:global)\n"
        "  -n, --nick NAME                display name (default anon)\n"
        "  -a, --announce-interval MS     peer poll interval before announcing (default 250)\n"
        "  -p, --probe-ttl SECONDS        forget unanswered pings after this long (default 0, never)\n"
        "  -h, --help                     show this help\n";
}

std::string relay_usage(const char* argv0) {
    return std::string("Usage: ") + argv0 + " [options]\n"
        "  -p, --port PORT    port to listen on (default 9002)\n"
        "  -v, --verbose      log joins and leaves\n"
        "  -h, --help         show this help\n";
}

} // namespace quichat::config
