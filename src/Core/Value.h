#pragma once

#include <cmath>
#include <optional>
#include <string>
#include <variant>

#include "Common.h"
#include "DType.h"

// Single dynamically typed element. std::nullopt is the explicit null marker,
// NaN stored as double is also treated as null.
using Value = std::variant<std::nullopt_t, int32_t, double, std::string, bool, Timestamp>;

// Row label of a Column/Table index.
using Label = std::variant<int64_t, std::string>;

inline bool isNull(const Value &value)
{
    if(std::holds_alternative<std::nullopt_t>(value))
        return true;
    if(auto d = std::get_if<double>(&value))
        return std::isnan(*d);
    return false;
}

// dtype the value would infer to, nullopt for the null marker (but NaN infers as Float64)
TABULA_EXPORT std::optional<DType> inferDType(const Value &value);

TABULA_EXPORT std::string formatDouble(double value);

// Text used for group keys, value counts and string conversion. Nulls give "null".
TABULA_EXPORT std::string toKeyString(const Value &value);

TABULA_EXPORT std::string to_string(const Label &label);
TABULA_EXPORT std::ostream &operator<<(std::ostream &out, const Value &value);
TABULA_EXPORT std::ostream &operator<<(std::ostream &out, const Label &label);

// Non-null value converted to the element type of given dtype, nullopt when no sensible conversion exists.
template<DType id>
struct ConvertTo {};

template<>
struct ConvertTo<DType::String>
{
    using R = std::optional<std::string>;
    R operator() (std::nullopt_t)                const { return std::nullopt; }
    template<typename T>
    R operator() (const T &value)                const { return toKeyString(value); }
};
template<>
struct ConvertTo<DType::Int32>
{
    using R = std::optional<int32_t>;
    R operator() (std::nullopt_t)                const { return std::nullopt; }
    R operator() (int32_t value)                 const { return value; }
    R operator() (double value)                  const;
    R operator() (const std::string &value)      const;
    R operator() (bool value)                    const { return value ? 1 : 0; }
    R operator() (Timestamp)                     const { return std::nullopt; }
};
template<>
struct ConvertTo<DType::Float64>
{
    using R = std::optional<double>;
    R operator() (std::nullopt_t)                const { return std::nullopt; }
    R operator() (int32_t value)                 const { return (double)value; }
    R operator() (double value)                  const { return value; }
    R operator() (const std::string &value)      const;
    R operator() (bool value)                    const { return value ? 1.0 : 0.0; }
    R operator() (Timestamp)                     const { return std::nullopt; }
};
template<>
struct ConvertTo<DType::Bool>
{
    using R = std::optional<bool>;
    R operator() (std::nullopt_t)                const { return std::nullopt; }
    R operator() (int32_t value)                 const { return value != 0; }
    R operator() (double value)                  const { return value != 0; }
    R operator() (const std::string &value)      const;
    R operator() (bool value)                    const { return value; }
    R operator() (Timestamp)                     const { return std::nullopt; }
};
template<>
struct ConvertTo<DType::DateTime>
{
    using R = std::optional<Timestamp>;
    R operator() (std::nullopt_t)                const { return std::nullopt; }
    R operator() (const std::string &value)      const { return parseTimestamp(value); }
    R operator() (Timestamp value)               const { return value; }
    template<typename T>
    R operator() (const T &)                     const { return std::nullopt; }
};

template<DType id>
auto convertValue(const Value &value)
{
    return std::visit(ConvertTo<id>{}, value);
}
