#include "Value.h"

#include <charconv>
#include <limits>

#include <boost/algorithm/string/predicate.hpp>

std::optional<DType> inferDType(const Value &value)
{
    return std::visit(overloaded{
        [] (std::nullopt_t)       -> std::optional<DType> { return std::nullopt; },
        [] (const auto &element)  -> std::optional<DType> { return dtypeOf<std::decay_t<decltype(element)>>; }
    }, value);
}

std::string formatDouble(double value)
{
    if(std::isnan(value))
        return "NaN";
    return fmt::format("{}", value);
}

std::string toKeyString(const Value &value)
{
    if(isNull(value))
        return "null";

    return std::visit(overloaded{
        [] (std::nullopt_t)             { return "null"s; },
        [] (int32_t i)                  { return std::to_string(i); },
        [] (double d)                   { return formatDouble(d); },
        [] (const std::string &s)       { return s; },
        [] (bool b)                     { return b ? "true"s : "false"s; },
        [] (const Timestamp &t)         { return std::to_string(t); }
    }, value);
}

std::string to_string(const Label &label)
{
    return std::visit(overloaded{
        [] (int64_t i)                  { return std::to_string(i); },
        [] (const std::string &s)       { return s; }
    }, label);
}

std::ostream &operator<<(std::ostream &out, const Value &value)
{
    return out << toKeyString(value);
}

std::ostream &operator<<(std::ostream &out, const Label &label)
{
    return out << to_string(label);
}

ConvertTo<DType::Int32>::R ConvertTo<DType::Int32>::operator()(double value) const
{
    if(std::isnan(value) || value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max())
        return std::nullopt;
    return (int32_t)value;
}

ConvertTo<DType::Int32>::R ConvertTo<DType::Int32>::operator()(const std::string &value) const
{
    int32_t out{};
    const auto end = value.data() + value.size();
    auto result = std::from_chars(value.data(), end, out, 10);
    if(result.ec == std::errc{} && result.ptr == end && !value.empty())
        return out;
    return std::nullopt;
}

ConvertTo<DType::Float64>::R ConvertTo<DType::Float64>::operator()(const std::string &value) const
{
    // std::from_chars for double is not yet available in all standard libraries
    try
    {
        size_t parsed = 0;
        auto out = std::stod(value, &parsed);
        if(parsed == value.size())
            return out;
    }
    catch(std::invalid_argument &) {}
    catch(std::out_of_range &) {}
    return std::nullopt;
}

ConvertTo<DType::Bool>::R ConvertTo<DType::Bool>::operator()(const std::string &value) const
{
    if(boost::iequals(value, "true"))
        return true;
    if(boost::iequals(value, "false"))
        return false;
    return std::nullopt;
}
