#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace quichat::chat {

inline constexpr char kCommandPrefix = '/';

inline constexpr std::string_view kHelpText =
    "Available commands:\n"
    "/help           Show this help\n"
    "/quit           Leave the chat\n"
    "/list           Show peers currently in the room\n"
    "/ping           Measure round-trip latency to all peers";

enum class CommandKind { List, Ping, Help, Quit, Unknown };

struct Command {
    CommandKind kind = CommandKind::Unknown;
    std::string word;  // normalized text after the prefix
};

// Empty when the line is ordinary chat text. Matching is case-insensitive
// on the whole trimmed remainder ("/Ping" is ping, "/ping now" is not).
std::optional<Command> parse_command(std::string_view line);

} // namespace quichat::chat
