/// @file date.hpp
/// @brief Ledger dates: calendar days stored as YYYYMMDD integers.

#pragma once

#include <chrono>
#include <cstdint>

namespace ledgersync {

/// A calendar day encoded as YYYYMMDD, e.g. 20240115.
using DateInt = std::int32_t;

/// Encode a calendar day.
constexpr auto to_date_int(std::chrono::year_month_day ymd) noexcept -> DateInt {
    return static_cast<int>(ymd.year()) * 10000
         + static_cast<int>(static_cast<unsigned>(ymd.month())) * 100
         + static_cast<int>(static_cast<unsigned>(ymd.day()));
}

/// Decode a YYYYMMDD integer. The result may be !ok() for garbage input.
constexpr auto from_date_int(DateInt date) noexcept -> std::chrono::year_month_day {
    return std::chrono::year_month_day{
        std::chrono::year{date / 10000},
        std::chrono::month{static_cast<unsigned>(date / 100 % 100)},
        std::chrono::day{static_cast<unsigned>(date % 100)},
    };
}

/// Whole days from a to b (negative if b is earlier).
constexpr auto days_between(DateInt a, DateInt b) noexcept -> std::int64_t {
    auto from = std::chrono::sys_days{from_date_int(a)};
    auto to = std::chrono::sys_days{from_date_int(b)};
    return (to - from).count();
}

/// Shift a date by a number of days.
constexpr auto add_days(DateInt date, std::int64_t days) noexcept -> DateInt {
    return to_date_int(std::chrono::sys_days{from_date_int(date)} + std::chrono::days{days});
}

/// The current UTC calendar day.
inline auto today() -> DateInt {
    return to_date_int(std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now()));
}

}  // namespace ledgersync
