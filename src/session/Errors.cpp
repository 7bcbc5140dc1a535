#include "session/Errors.h"

#include <string>

namespace quichat::session {

namespace {

class QuichatCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "quichat"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::cancelled:        return "session cancelled";
            case errc::channel_closed:   return "channel closed";
            case errc::end_of_input:     return "end of input";
            case errc::interrupted:      return "interrupted";
            case errc::terminal_failure: return "terminal failure";
            case errc::publish_failed:   return "publish failed";
            case errc::not_connected:    return "not connected";
        }
        return "unknown quichat error";
    }
};

} // namespace

const boost::system::error_category& error_category() noexcept {
    static const QuichatCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), error_category());
}

} // namespace quichat::session
