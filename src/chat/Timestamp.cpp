#include "chat/Timestamp.h"

#include <cstdint>
#include <ctime>

namespace quichat::chat {

namespace {

using std::int64_t;

// Howard Hinnant's civil calendar conversions (proleptic Gregorian).
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d) noexcept {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

bool is_leap(int64_t y) noexcept {
    return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

unsigned days_in_month(int64_t y, unsigned m) noexcept {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29u : kDays[m - 1];
}

bool read_digits(std::string_view s, std::size_t pos, std::size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (s[i] < '0' || s[i] > '9') return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

bool expect(std::string_view s, std::size_t pos, char c) {
    return pos < s.size() && s[pos] == c;
}

void append_padded(std::string& out, int64_t value, int width) {
    std::string digits = std::to_string(value);
    if (static_cast<int>(digits.size()) < width) {
        out.append(static_cast<std::size_t>(width) - digits.size(), '0');
    }
    out += digits;
}

} // namespace

std::string format_rfc3339(Timestamp ts) {
    using namespace std::chrono;

    const int64_t total_ns = duration_cast<nanoseconds>(ts.time_since_epoch()).count();
    constexpr int64_t kNsPerSec = 1'000'000'000;
    constexpr int64_t kSecPerDay = 86'400;

    int64_t secs = total_ns / kNsPerSec;
    int64_t frac = total_ns % kNsPerSec;
    if (frac < 0) {
        frac += kNsPerSec;
        --secs;
    }
    int64_t days = secs / kSecPerDay;
    int64_t sod = secs % kSecPerDay;
    if (sod < 0) {
        sod += kSecPerDay;
        --days;
    }

    int64_t year = 0;
    unsigned month = 0, day = 0;
    civil_from_days(days, year, month, day);

    std::string out;
    out.reserve(35);
    append_padded(out, year, 4);
    out += '-';
    append_padded(out, month, 2);
    out += '-';
    append_padded(out, day, 2);
    out += 'T';
    append_padded(out, sod / 3600, 2);
    out += ':';
    append_padded(out, (sod / 60) % 60, 2);
    out += ':';
    append_padded(out, sod % 60, 2);

    if (frac != 0) {
        std::string digits;
        append_padded(digits, frac, 9);
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += '.';
        out += digits;
    }
    out += 'Z';
    return out;
}

std::optional<Timestamp> parse_rfc3339(std::string_view s) {
    using namespace std::chrono;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(s, 0, 4, year) || !expect(s, 4, '-') ||
        !read_digits(s, 5, 2, month) || !expect(s, 7, '-') ||
        !read_digits(s, 8, 2, day)) {
        return std::nullopt;
    }
    if (!(expect(s, 10, 'T') || expect(s, 10, 't') || expect(s, 10, ' '))) return std::nullopt;
    if (!read_digits(s, 11, 2, hour) || !expect(s, 13, ':') ||
        !read_digits(s, 14, 2, minute) || !expect(s, 16, ':') ||
        !read_digits(s, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    int64_t frac_ns = 0;
    if (expect(s, pos, '.')) {
        ++pos;
        std::size_t digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            if (digits < 9) {
                frac_ns = frac_ns * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (std::size_t i = digits; i < 9; ++i) frac_ns *= 10;
    }

    int64_t offset_secs = 0;
    if (expect(s, pos, 'Z') || expect(s, pos, 'z')) {
        ++pos;
    } else if (expect(s, pos, '+') || expect(s, pos, '-')) {
        const int sign = s[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (!read_digits(s, pos + 1, 2, oh) || !expect(s, pos + 3, ':') ||
            !read_digits(s, pos + 4, 2, om) || oh > 23 || om > 59) {
            return std::nullopt;
        }
        offset_secs = sign * (oh * 3600 + om * 60);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    const int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                         static_cast<unsigned>(day));
    const int64_t secs = days * 86'400 + hour * 3600 + minute * 60 + second - offset_secs;

    // Nanoseconds since the epoch only span about 1678..2262.
    constexpr int64_t kMaxSecs = duration_cast<seconds>(nanoseconds::max()).count() - 1;
    constexpr int64_t kMinSecs = duration_cast<seconds>(nanoseconds::min()).count() + 1;
    if (secs > kMaxSecs || secs < kMinSecs) return std::nullopt;

    const nanoseconds since_epoch{secs * 1'000'000'000 + frac_ns};
    return Timestamp(duration_cast<system_clock::duration>(since_epoch));
}

std::string format_clock_time(Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

} // namespace quichat::chat
