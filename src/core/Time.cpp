// SPDX-License-Identifier: Apache-2.0
#include "Time.hpp"

#include <charconv>
#include <format>

namespace sightline
{

namespace
{

    /// @brief Reads exactly `width` decimal digits starting at `pos`.
    auto readDigits(std::string_view text, size_t pos, size_t width, int& out) -> bool
    {
        if (pos + width > text.size())
            return false;
        auto const* first = text.data() + pos;
        auto const [ptr, ec] = std::from_chars(first, first + width, out);
        return ec == std::errc {} && ptr == first + width;
    }

} // namespace

auto formatTimestamp(Clock::time_point tp) -> std::string
{
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::microseconds>(tp));
}

auto formatFileTimestamp(Timestamp ts) -> std::string
{
    auto const day = std::chrono::floor<std::chrono::days>(ts);
    auto const time = std::chrono::hh_mm_ss { ts - day };
    return std::format("{:%F}_{:02}-{:02}-{:02}.{:06}",
                       std::chrono::sys_days { day },
                       time.hours().count(),
                       time.minutes().count(),
                       time.seconds().count(),
                       time.subseconds().count());
}

auto parseTimestamp(std::string_view text) -> Result<Timestamp>
{
    auto invalid = [&] {
        return makeError(ErrorCode::InvalidArgument, std::format("Invalid ISO-8601 timestamp: '{}'", text));
    };

    // YYYY-MM-DDTHH:MM:SS
    if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ')
        || text[13] != ':' || text[16] != ':')
        return invalid();

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!readDigits(text, 0, 4, y) || !readDigits(text, 5, 2, mo) || !readDigits(text, 8, 2, d)
        || !readDigits(text, 11, 2, h) || !readDigits(text, 14, 2, mi) || !readDigits(text, 17, 2, s))
        return invalid();

    auto pos = size_t { 19 };
    auto micros = std::int64_t { 0 };
    if (pos < text.size() && text[pos] == '.')
    {
        ++pos;
        auto digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
        {
            if (digits < 6)
            {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0)
            return invalid();
        for (; digits < 6; ++digits)
            micros *= 10;
    }

    auto const suffix = text.substr(pos);
    if (suffix != "Z" && suffix != "+00:00" && !suffix.empty())
        return invalid();

    auto const date = std::chrono::year_month_day { std::chrono::year { y },
                                                    std::chrono::month { static_cast<unsigned>(mo) },
                                                    std::chrono::day { static_cast<unsigned>(d) } };
    if (!date.ok() || h > 23 || mi > 59 || s > 60)
        return invalid();

    return Timestamp { std::chrono::sys_days { date }.time_since_epoch() + std::chrono::hours { h }
                       + std::chrono::minutes { mi } + std::chrono::seconds { s }
                       + std::chrono::microseconds { micros } };
}

} // namespace sightline
