#include "chat/Commands.h"

#include <algorithm>
#include <cctype>

namespace quichat::chat {

namespace {

std::string normalize(std::string_view s) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;
    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    std::string out(s.substr(start, end - start));
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return out;
}

} // namespace

std::optional<Command> parse_command(std::string_view line) {
    if (line.empty() || line.front() != kCommandPrefix) return std::nullopt;

    Command cmd;
    cmd.word = normalize(line.substr(1));

    if (cmd.word == "list") {
        cmd.kind = CommandKind::List;
    } else if (cmd.word == "ping") {
        cmd.kind = CommandKind::Ping;
    } else if (cmd.word == "help" || cmd.word == "h" || cmd.word == "?") {
        cmd.kind = CommandKind::Help;
    } else if (cmd.word == "quit" || cmd.word == "exit" || cmd.word == "q") {
        cmd.kind = CommandKind::Quit;
    } else {
        cmd.kind = CommandKind::Unknown;
    }
    return cmd;
}

} // namespace quichat::chat
