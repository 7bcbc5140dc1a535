#include "terminal/ReadlineTerminal.h"

#include "session/Errors.h"

#include <readline/history.h>
#include <readline/readline.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace quichat::terminal {

ReadlineTerminal* ReadlineTerminal::current_instance_ = nullptr;
int ReadlineTerminal::signal_fd_ = -1;

ReadlineTerminal::ReadlineTerminal(std::string prompt) : prompt_(std::move(prompt)) {
    if (current_instance_) {
        throw std::logic_error("only one ReadlineTerminal may exist at a time");
    }
    if (::pipe(wake_pipe_) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }
    for (int fd : wake_pipe_) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    current_instance_ = this;
    signal_fd_ = wake_pipe_[1];

    struct sigaction sa{};
    sa.sa_handler = &ReadlineTerminal::on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    ::sigaction(SIGINT, &sa, &previous_sigint_);

    // We own SIGINT; readline must not install its own handlers.
    rl_catch_signals = 0;
    rl_callback_handler_install(prompt_.c_str(), &ReadlineTerminal::line_handler);
}

ReadlineTerminal::~ReadlineTerminal() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::fputs("\r\x1b[2K", stdout);
        std::fflush(stdout);
        rl_callback_handler_remove();
    }

    ::sigaction(SIGINT, &previous_sigint_, nullptr);
    signal_fd_ = -1;
    current_instance_ = nullptr;

    ::close(wake_pipe_[0]);
    ::close(wake_pipe_[1]);
}

std::string ReadlineTerminal::read_line(session::CancellationToken& token, boost::system::error_code& ec) {
    ec = {};
    session::CancellationToken::Registration wake_on_cancel(token, [this] { wake('c'); });

    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!lines_.empty()) {
                std::string line = std::move(lines_.front());
                lines_.pop_front();
                return line;
            }
            if (eof_) {
                ec = session::errc::end_of_input;
                return {};
            }
        }
        if (token.cancelled()) {
            ec = session::errc::cancelled;
            return {};
        }

        pollfd fds[2] = {
            {STDIN_FILENO, POLLIN, 0},
            {wake_pipe_[0], POLLIN, 0},
        };
        if (::poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            ec = session::errc::terminal_failure;
            return {};
        }

        if (fds[1].revents & POLLIN) {
            if (drain_wake_pipe()) {
                std::lock_guard<std::mutex> lk(mu_);
                discard_input_locked();
                ec = session::errc::interrupted;
                return {};
            }
            continue;
        }

        if (fds[0].revents & (POLLIN | POLLHUP)) {
            std::lock_guard<std::mutex> lk(mu_);
            rl_callback_read_char();
            continue;
        }

        if (fds[0].revents & (POLLERR | POLLNVAL)) {
            ec = session::errc::terminal_failure;
            return {};
        }
    }
}

void ReadlineTerminal::print(const std::string& block) {
    std::lock_guard<std::mutex> lk(mu_);

    // 1. Save what the user is currently typing
    char* saved_line = rl_copy_text(0, rl_end);
    int saved_point = rl_point;

    // 2. Clear the prompt line
    rl_save_prompt();
    rl_replace_line("", 0);
    rl_redisplay();
    std::fputs("\r\x1b[2K", stdout);

    // 3. Write the block
    std::fwrite(block.data(), 1, block.size(), stdout);
    if (block.empty() || block.back() != '\n') std::fputc('\n', stdout);
    std::fflush(stdout);

    // 4. Restore prompt and input, redraw
    rl_restore_prompt();
    rl_replace_line(saved_line, 0);
    rl_point = saved_point;
    rl_forced_update_display();

    std::free(saved_line);
}

void ReadlineTerminal::write(const std::string& bytes) {
    std::lock_guard<std::mutex> lk(mu_);
    std::fwrite(bytes.data(), 1, bytes.size(), stdout);
    std::fflush(stdout);
}

void ReadlineTerminal::retract_echo() {
    std::lock_guard<std::mutex> lk(mu_);
    // Readline already drew a fresh prompt below the accepted line.
    std::fputs("\r\x1b[2K\x1b[1A\x1b[2K\r", stdout);
    std::fflush(stdout);
    rl_on_new_line();
    rl_forced_update_display();
}

void ReadlineTerminal::wake(char reason) {
    // Best effort: a full pipe already guarantees a wakeup.
    ssize_t n = ::write(wake_pipe_[1], &reason, 1);
    (void)n;
}

bool ReadlineTerminal::drain_wake_pipe() {
    bool interrupted = false;
    char buf[64];
    ssize_t n;
    while ((n = ::read(wake_pipe_[0], buf, sizeof(buf))) > 0) {
        for (ssize_t i = 0; i < n; ++i) {
            if (buf[i] == 'i') interrupted = true;
        }
    }
    return interrupted;
}

void ReadlineTerminal::discard_input_locked() {
    std::fputs("^C\n", stdout);
    rl_replace_line("", 0);
    rl_point = 0;
    rl_on_new_line();
    rl_redisplay();
}

void ReadlineTerminal::line_handler(char* line) {     // called from rl_callback_read_char, mu_ held
    ReadlineTerminal* self = current_instance_;
    if (line == nullptr) { // Ctrl+D
        if (self) self->eof_ = true;
        return;
    }

    if (line[0] != '\0') add_history(line);
    if (self) self->lines_.emplace_back(line);

    std::free(line);
}

void ReadlineTerminal::on_sigint(int) {
    const int saved_errno = errno;
    if (signal_fd_ >= 0) {
        const char reason = 'i';
        ssize_t n = ::write(signal_fd_, &reason, 1);
        (void)n;
    }
    errno = saved_errno;
}

} // namespace quichat::terminal
