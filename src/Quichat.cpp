#include "chat/IDGenerator.hpp"
#include "chat/Identity.h"
#include "config/Options.h"
#include "networking/WebSocketChannel.h"
#include "session/Session.h"
#include "terminal/ReadlineTerminal.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <exception>
#include <iostream>
#include <thread>

static constexpr const char* kBanner = R"(
  ___  _   _ ___ ___ _  _   _ _____
 / _ \| | | |_ _/ __| || | /_\_   _|
| (_) | |_| || | (__| __ |/ _ \| |
 \__\_\\___/|___\___|_||_/_/ \_\_|
)";

int main(int argc, char* argv[]) {
    using namespace quichat;

    config::ClientOptions opts;
    try {
        opts = config::parse_client_options(argc, argv);
    } catch (const config::UsageError& e) {
        std::cerr << "[quichat] " << e.what() << "\n" << config::client_usage(argv[0]);
        return 2;
    }
    if (opts.show_help) {
        std::cout << config::client_usage(argv[0]);
        return 0;
    }

    try {
        chat::IDGenerator idgen;
        chat::Identity self(idgen, opts.nick);

        networking::WebSocketChannel channel(opts.relay_host, opts.relay_port, opts.topic);
        channel.connect();

        std::cout << kBanner << "\n";
        std::cout << "Welcome to Quichat!\n";
        std::cout << "Your peer id: " << channel.peer_id() << " on " << channel.topic()
                  << " via " << opts.relay_host << ":" << opts.relay_port << "\n";
        std::cout << "Type /help for commands.\n";

        session::SessionOptions session_opts;
        session_opts.announce_interval = opts.announce_interval;
        session_opts.probe_ttl = opts.probe_ttl;

        boost::system::error_code result;
        {
            terminal::ReadlineTerminal term("> ");
            session::Session chat_session(channel, term, self, session_opts);

            // SIGINT belongs to the terminal (clears the input line).
            boost::asio::io_context signal_ioc;
            boost::asio::signal_set signals(signal_ioc, SIGTERM, SIGHUP);
            signals.async_wait([&](const boost::system::error_code& ec, int) {
                if (!ec) chat_session.stop();
            });
            std::thread signal_thread([&] { signal_ioc.run(); });

            result = chat_session.run();

            signal_ioc.stop();
            signal_thread.join();
        }
        channel.close();

        if (result) {
            std::string what;
            auto cause = channel.last_error(&what);
            std::cerr << "[quichat] session ended: " << result.message();
            if (cause) std::cerr << " (" << what << ": " << cause.message() << ")";
            std::cerr << "\n";
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "[quichat] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
