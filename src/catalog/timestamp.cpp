#include "docstore/catalog/timestamp.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace docstore::catalog {

namespace {

bool read_digits(std::string_view text, std::size_t& position, std::size_t count, int& out) noexcept
{
    if (position + count > text.size()) {
        return false;
    }
    int value = 0;
    for (std::size_t index = 0U; index < count; ++index) {
        const auto ch = static_cast<unsigned char>(text[position + index]);
        if (std::isdigit(ch) == 0) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    position += count;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& position, char ch) noexcept
{
    if (position >= text.size() || text[position] != ch) {
        return false;
    }
    ++position;
    return true;
}

}  // namespace

Timestamp now_timestamp()
{
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

Timestamp timestamp_from_epoch_ms(std::int64_t epoch_ms) noexcept
{
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

std::string format_timestamp_iso(Timestamp timestamp)
{
    const auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
    const auto millis = (timestamp - seconds).count();
    const auto time_value = Clock::to_time_t(seconds);

    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    stream << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return stream.str();
}

std::optional<Timestamp> parse_timestamp_iso(std::string_view text)
{
    std::size_t position = 0U;
    int year = 0;
    int month = 0;
    int day = 0;
    if (!read_digits(text, position, 4U, year) || !expect(text, position, '-') ||
        !read_digits(text, position, 2U, month) || !expect(text, position, '-') ||
        !read_digits(text, position, 2U, day)) {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{std::chrono::year{year},
                                           std::chrono::month{static_cast<unsigned>(month)},
                                           std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        return std::nullopt;
    }

    int hour = 0;
    int minute = 0;
    int second = 0;
    std::int64_t millis = 0;
    std::int64_t offset_minutes = 0;

    if (position < text.size() && (text[position] == 'T' || text[position] == 't' || text[position] == ' ')) {
        ++position;
        if (!read_digits(text, position, 2U, hour) || !expect(text, position, ':') ||
            !read_digits(text, position, 2U, minute)) {
            return std::nullopt;
        }
        if (position < text.size() && text[position] == ':') {
            ++position;
            if (!read_digits(text, position, 2U, second)) {
                return std::nullopt;
            }
            if (position < text.size() && text[position] == '.') {
                ++position;
                std::size_t digits = 0U;
                std::int64_t scale = 100;
                while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                    if (digits < 3U) {
                        millis += (text[position] - '0') * scale;
                        scale /= 10;
                    }
                    ++digits;
                    ++position;
                }
                if (digits == 0U) {
                    return std::nullopt;
                }
            }
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }

        if (position < text.size()) {
            const char designator = text[position];
            if (designator == 'Z' || designator == 'z') {
                ++position;
            } else if (designator == '+' || designator == '-') {
                ++position;
                int offset_hours = 0;
                int offset_mins = 0;
                if (!read_digits(text, position, 2U, offset_hours)) {
                    return std::nullopt;
                }
                (void)expect(text, position, ':');
                if (!read_digits(text, position, 2U, offset_mins)) {
                    return std::nullopt;
                }
                offset_minutes = offset_hours * 60 + offset_mins;
                if (designator == '-') {
                    offset_minutes = -offset_minutes;
                }
            }
        }
    }

    if (position != text.size()) {
        return std::nullopt;
    }

    Timestamp result{std::chrono::sys_days{date}};
    result += std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second} +
              std::chrono::milliseconds{millis};
    result -= std::chrono::minutes{offset_minutes};
    return result;
}

}  // namespace docstore::catalog
