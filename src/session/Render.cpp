#include "session/Render.h"

namespace quichat::session {

namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kBoldGreen = "\033[1;32m";
constexpr const char* kCyan = "\033[36m";

std::string continue_lines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += c;
        if (c == '\n') out += "» ";
    }
    return out;
}

} // namespace

std::string render_chat(const std::string& nick, const std::string& text, chat::Timestamp delivered) {
    return "> [" + chat::format_clock_time(delivered) + "] [" + kGreen + nick + kReset + "]\n" +
           "» " + continue_lines(text) + "\n\n";
}

std::string render_join(const std::string& nick) {
    return std::string(kBoldGreen) + "*** " + nick + " joined the chat ***" + kReset;
}

std::string render_pong(const std::string& nick, std::chrono::steady_clock::duration elapsed) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    return std::string(kCyan) + "Pong from " + nick + ": " + std::to_string(ms) + " ms" + kReset;
}

std::string render_peers(const std::vector<std::string>& peers) {
    std::string out = "Peers (" + std::to_string(peers.size()) + "): [";
    for (std::size_t i = 0; i < peers.size(); ++i) {
        if (i) out += ' ';
        out += peers[i];
    }
    out += ']';
    return out;
}

std::string render_unknown_command(const std::string& word) {
    return "Unknown command: " + word;
}

std::string render_farewell() {
    return "👋  Bye!";
}

} // namespace quichat::session
