#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "chat/Timestamp.h"

namespace quichat::session {

// Terminal text for each kind of event. Blocks carry no prompt; the
// terminal redraws it.
std::string render_chat(const std::string& nick, const std::string& text, chat::Timestamp delivered);
std::string render_join(const std::string& nick);
std::string render_pong(const std::string& nick, std::chrono::steady_clock::duration elapsed);
std::string render_peers(const std::vector<std::string>& peers);
std::string render_unknown_command(const std::string& word);
std::string render_farewell();

} // namespace quichat::session
