#include "chat/IDGenerator.hpp"
#include "config/Options.h"
#include "networking/TopicRelay.h"
#include "networking/WebSocketServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <exception>
#include <iostream>

int main(int argc, char* argv[]) {
    using namespace quichat;

    config::RelayOptions opts;
    try {
        opts = config::parse_relay_options(argc, argv);
    } catch (const config::UsageError& e) {
        std::cerr << "[quichat-relay] " << e.what() << "\n" << config::relay_usage(argv[0]);
        return 2;
    }
    if (opts.show_help) {
        std::cout << config::relay_usage(argv[0]);
        return 0;
    }

    try {
        boost::asio::io_context ioc;
        chat::IDGenerator idgen;

        networking::WebSocketServer server(ioc, opts.port);
        networking::TopicRelay relay(server, idgen, opts.verbose);
        server.start();

        // Graceful shutdown on Ctrl+C / SIGTERM
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            std::cout << "\n[quichat-relay] shutting down (" << relay.member_count() << " connected)...\n";
            server.stop();
            ioc.stop();
        });

        std::cout << "[quichat-relay] WS relay running on port " << server.port() << "\n";
        ioc.run();
        std::cout << "[quichat-relay] exit.\n";
    } catch (const std::exception& e) {
        std::cerr << "[quichat-relay] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
