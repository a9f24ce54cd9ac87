#include "Timestamp.h"

#include <sstream>

Timestamp::Timestamp(date::year_month_day ymd)
    : Base(date::sys_days(ymd))
{
}

std::string std::to_string(const Timestamp &t)
{
    std::ostringstream out;
    if(t == date::floor<date::days>(t))
        out << date::format("%F", t);
    else
        out << date::format("%F %T", t);
    return out.str();
}

namespace
{
    std::optional<Timestamp> tryParse(const std::string &text, const char *format)
    {
        std::istringstream input(text);
        Timestamp out;
        input >> date::parse(format, out);
        if(input && input.rdbuf()->in_avail() == 0)
            return out;
        return std::nullopt;
    }
}

std::optional<Timestamp> parseTimestamp(std::string_view text)
{
    const auto textString = std::string(text);
    if(auto ret = tryParse(textString, "%F %T"))
        return ret;
    return tryParse(textString, "%F");
}
