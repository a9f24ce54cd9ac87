#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <date/date.h>

#include "Common.h"

using TimestampDuration = std::chrono::duration<int64_t, std::nano>;

struct Timestamp;

namespace std
{
    TABULA_EXPORT std::string to_string(const Timestamp &t);
}

// timestamp represents nanoseconds since unix epoch
struct TABULA_EXPORT Timestamp : std::chrono::time_point<std::chrono::system_clock, TimestampDuration>
{
    using Base = std::chrono::time_point<std::chrono::system_clock, TimestampDuration>;
    Timestamp() = default;
    explicit Timestamp(int64_t nanoticks) : Base(TimestampDuration(nanoticks)) {}
    Timestamp(date::year_month_day ymd);
    using Base::time_point;

    int64_t toStorage() const { return time_since_epoch().count(); }

    constexpr date::year_month_day ymd() const
    {
        return { date::floor<date::days>(*this) };
    }

    friend std::ostream &operator<<(std::ostream &out, const Timestamp &t)
    {
        return out << std::to_string(t);
    }
};

namespace std
{
    template <>
    struct hash<Timestamp>
    {
        size_t operator()(const Timestamp &t) const
        {
            return std::hash<int64_t>{}(t.toStorage());
        }
    };
}

// Accepts "YYYY-MM-DD" and "YYYY-MM-DD HH:MM:SS" (optionally with fractional seconds).
TABULA_EXPORT std::optional<Timestamp> parseTimestamp(std::string_view text);
