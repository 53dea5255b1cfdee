#include "core/replay_time.hpp"

#include <cctype>
#include <charconv>

namespace core {
namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm).
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

static_assert(days_from_civil(1970, 1, 1) == 0);
static_assert(days_from_civil(2000, 3, 1) == 11017);

constexpr bool is_leap(std::int64_t y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr unsigned days_in_month(std::int64_t y, unsigned m) noexcept {
    constexpr unsigned table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : table[m - 1];
}

class FieldReader {
public:
    explicit FieldReader(std::string_view s) : s_(s) {}

    bool digits(std::size_t n, unsigned& out) noexcept {
        if (pos_ + n > s_.size()) {
            return false;
        }
        out = 0;
        for (std::size_t i = 0; i < n; ++i) {
            const char c = s_[pos_ + i];
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            out = out * 10 + static_cast<unsigned>(c - '0');
        }
        pos_ += n;
        return true;
    }

    bool literal(char c) noexcept {
        if (pos_ < s_.size() && s_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    char peek() const noexcept { return pos_ < s_.size() ? s_[pos_] : '\0'; }
    void advance() noexcept { ++pos_; }
    bool done() const noexcept { return pos_ == s_.size(); }

private:
    std::string_view s_;
    std::size_t pos_{0};
};

bool all_digits(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool parse_created_timestamp(std::string_view text, std::int64_t& unix_ms, std::string& err) noexcept {
    if (all_digits(text)) {
        std::int64_t secs = 0;
        const auto res = std::from_chars(text.data(), text.data() + text.size(), secs);
        if (res.ec != std::errc() || secs > 253'402'300'799LL) {
            err = "timestamp out of range";
            return false;
        }
        unix_ms = secs * 1000;
        return true;
    }

    FieldReader r(text);
    unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!r.digits(4, year) || !r.literal('-') || !r.digits(2, month) || !r.literal('-') || !r.digits(2, day)) {
        err = "invalid date";
        return false;
    }
    if (!(r.literal('T') || r.literal('t') || r.literal(' '))) {
        err = "missing date/time separator";
        return false;
    }
    if (!r.digits(2, hour) || !r.literal(':') || !r.digits(2, minute) || !r.literal(':') || !r.digits(2, second)) {
        err = "invalid time";
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 || minute > 59 ||
        second > 60) {
        err = "date/time field out of range";
        return false;
    }

    unsigned millis = 0;
    if (r.literal('.')) {
        int fraction_digits = 0;
        while (std::isdigit(static_cast<unsigned char>(r.peek()))) {
            if (fraction_digits < 3) {
                millis = millis * 10 + static_cast<unsigned>(r.peek() - '0');
            }
            ++fraction_digits;
            r.advance();
        }
        if (fraction_digits == 0) {
            err = "empty fraction";
            return false;
        }
        for (int i = fraction_digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    std::int64_t offset_minutes = 0;
    if (r.literal('Z') || r.literal('z')) {
        // UTC
    } else if (r.peek() == '+' || r.peek() == '-') {
        const bool negative = r.peek() == '-';
        r.advance();
        unsigned oh = 0, om = 0;
        if (!r.digits(2, oh) || !r.literal(':') || !r.digits(2, om) || oh > 23 || om > 59) {
            err = "invalid UTC offset";
            return false;
        }
        offset_minutes = static_cast<std::int64_t>(oh) * 60 + om;
        if (negative) {
            offset_minutes = -offset_minutes;
        }
    } else {
        err = "missing UTC offset";
        return false;
    }
    if (!r.done()) {
        err = "trailing characters in timestamp";
        return false;
    }

    const std::int64_t days = days_from_civil(year, month, day);
    const std::int64_t secs = days * 86400 + static_cast<std::int64_t>(hour) * 3600 +
                              static_cast<std::int64_t>(minute) * 60 + second - offset_minutes * 60;
    unix_ms = secs * 1000 + millis;
    return true;
}

} // namespace core
