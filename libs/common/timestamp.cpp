/**
 * @file timestamp.cpp
 * @brief UTC timestamp formatting and ISO-8601 parsing
 */

#include "semverpp/common.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <system_error>

namespace semverpp::common {

namespace {

struct Cursor
{
    std::string_view text;
    std::size_t pos = 0;

    [[nodiscard]] bool at_end() const noexcept { return pos >= text.size(); }
    [[nodiscard]] char peek() const noexcept { return at_end() ? '\0' : text[pos]; }
};

[[nodiscard]] bool read_fixed_int(Cursor& cursor, std::size_t digits, int& out)
{
    if (cursor.pos + digits > cursor.text.size()) {
        return false;
    }
    const char* begin = cursor.text.data() + cursor.pos;
    const char* end = begin + digits;
    auto [ptr, ec] = std::from_chars(begin, end, out);
    if (ec != std::errc{} || ptr != end) {
        return false;
    }
    cursor.pos += digits;
    return true;
}

[[nodiscard]] bool expect(Cursor& cursor, char c)
{
    if (cursor.peek() != c) {
        return false;
    }
    ++cursor.pos;
    return true;
}

[[nodiscard]] semverpp::Error parse_error(std::string_view text)
{
    return Error::make(std::string(error_code::kParseError),
                       "Invalid ISO-8601 timestamp: '" + std::string(text) + "'");
}

}  // namespace

std::string format_compact_timestamp(std::chrono::system_clock::time_point tp)
{
    const auto micros = std::chrono::floor<std::chrono::microseconds>(tp);
    const auto secs = std::chrono::floor<std::chrono::seconds>(micros);
    const auto fraction = (micros - secs).count();
    return std::format("{:%Y%m%d%H%M%S}{:06}", secs, fraction);
}

std::string format_iso8601(SysSeconds tp)
{
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", tp);
}

semverpp::Result<SysSeconds> parse_iso8601(std::string_view text)
{
    Cursor cursor{.text = text, .pos = 0};
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    if (!read_fixed_int(cursor, 4, year) || !expect(cursor, '-') || !read_fixed_int(cursor, 2, month)
        || !expect(cursor, '-') || !read_fixed_int(cursor, 2, day)) {
        return std::unexpected(parse_error(text));
    }
    if (cursor.peek() != 'T' && cursor.peek() != 't' && cursor.peek() != ' ') {
        return std::unexpected(parse_error(text));
    }
    ++cursor.pos;
    if (!read_fixed_int(cursor, 2, hour) || !expect(cursor, ':')
        || !read_fixed_int(cursor, 2, minute) || !expect(cursor, ':')
        || !read_fixed_int(cursor, 2, second)) {
        return std::unexpected(parse_error(text));
    }

    // Fractional seconds are dropped; records compare at second precision.
    if (cursor.peek() == '.' || cursor.peek() == ',') {
        ++cursor.pos;
        const std::size_t start = cursor.pos;
        while (!cursor.at_end() && std::isdigit(static_cast<unsigned char>(cursor.peek())) != 0) {
            ++cursor.pos;
        }
        if (cursor.pos == start) {
            return std::unexpected(parse_error(text));
        }
    }

    std::chrono::minutes offset{0};
    if (cursor.peek() == 'Z' || cursor.peek() == 'z') {
        ++cursor.pos;
    } else if (cursor.peek() == '+' || cursor.peek() == '-') {
        const bool negative = cursor.peek() == '-';
        ++cursor.pos;
        int offset_hours = 0;
        int offset_minutes = 0;
        if (!read_fixed_int(cursor, 2, offset_hours)) {
            return std::unexpected(parse_error(text));
        }
        static_cast<void>(expect(cursor, ':'));
        if (!read_fixed_int(cursor, 2, offset_minutes)) {
            return std::unexpected(parse_error(text));
        }
        offset = std::chrono::hours{offset_hours} + std::chrono::minutes{offset_minutes};
        if (negative) {
            offset = -offset;
        }
    }
    if (!cursor.at_end()) {
        return std::unexpected(parse_error(text));
    }

    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return std::unexpected(parse_error(text));
    }

    SysSeconds local = std::chrono::sys_days{ymd} + std::chrono::hours{hour}
                       + std::chrono::minutes{minute} + std::chrono::seconds{second};
    return local - offset;
}

}  // namespace semverpp::common
