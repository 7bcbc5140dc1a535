#pragma once

#include <signal.h>

#include <deque>
#include <mutex>
#include <string>

#include "session/Terminal.h"

namespace quichat::terminal {

// GNU readline in callback mode. The reading thread polls stdin together
// with a self-pipe, so a read can be woken by Ctrl+C (interrupted) or by
// the session token (cancelled). One instance per process.
class ReadlineTerminal : public session::Terminal {
public:
    explicit ReadlineTerminal(std::string prompt = "> ");
    ~ReadlineTerminal() override;

    ReadlineTerminal(const ReadlineTerminal&) = delete;
    ReadlineTerminal& operator=(const ReadlineTerminal&) = delete;

    std::string read_line(session::CancellationToken& token, boost::system::error_code& ec) override;
    void print(const std::string& block) override;
    void write(const std::string& bytes) override;
    void retract_echo() override;

private:
    void wake(char reason);
    bool drain_wake_pipe();  // true when an interrupt was pending
    void discard_input_locked();

    // --- Readline / signal callbacks ---
    // Must be static to be used as C-style function pointers.
    static void line_handler(char* line);
    static void on_sigint(int);

    static ReadlineTerminal* current_instance_;
    static int signal_fd_;

    std::string prompt_;
    int wake_pipe_[2] = {-1, -1};
    struct sigaction previous_sigint_{};

    // Guards readline state, stdout, and the fields below.
    std::mutex mu_;
    std::deque<std::string> lines_;
    bool eof_ = false;
};

} // namespace quichat::terminal
