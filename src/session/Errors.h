#pragma once

#include <boost/system/error_code.hpp>

#include <type_traits>

namespace quichat::session {

enum class errc {
    cancelled = 1,     // the session token fired
    channel_closed,    // the pub/sub channel is gone
    end_of_input,      // terminal reached end of stream
    interrupted,       // interrupt keystroke while reading a line
    terminal_failure,  // terminal device error
    publish_failed,
    not_connected
};

const boost::system::error_category& error_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

} // namespace quichat::session

namespace boost::system {

template <>
struct is_error_code_enum<quichat::session::errc> : std::true_type {};

} // namespace boost::system
