#pragma once

#include <string>

#include <boost/system/error_code.hpp>

#include "session/Cancellation.h"

namespace quichat::session {

// Line-oriented interactive device. All output methods are serialized
// against each other and against line editing.
class Terminal {
public:
    virtual ~Terminal() = default;

    // Fails with errc::interrupted (keep reading), errc::end_of_input,
    // errc::cancelled or errc::terminal_failure.
    virtual std::string read_line(CancellationToken& token, boost::system::error_code& ec) = 0;

    // Clears the input line, writes the block, redraws the prompt and any
    // partially typed input. A trailing newline is added when missing.
    virtual void print(const std::string& block) = 0;

    // Raw bytes, no prompt handling.
    virtual void write(const std::string& bytes) = 0;

    // Erases the echo of the line just submitted.
    virtual void retract_echo() = 0;
};

} // namespace quichat::session
