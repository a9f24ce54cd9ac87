#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h> // needed for fmt to use user-provided operator<<

#include "Logger.h"

using namespace std::literals;
using namespace std::chrono_literals;

#if defined(_MSC_VER)
#define EXPORT __declspec(dllexport)
#else
#define EXPORT [[gnu::visibility ("default")]]
#endif

#ifdef BUILDING_TABULA
#define TABULA_EXPORT EXPORT
#else
#define TABULA_EXPORT
#endif

constexpr size_t operator"" _z (unsigned long long n)
{
    return n;
}

// helpers for variant visitation with lambda set
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// to allow conditional static_asserts
template<class T> struct always_false : std::false_type {};
template<class T> constexpr bool always_false_v = always_false<T>::value;

template<typename Range, typename F>
auto transformToVector(Range &&range, F &&f)
{
    using SourceT = decltype(*std::begin(range));
    using T = std::decay_t<std::invoke_result_t<F, SourceT>>;

    std::vector<T> ret;
    ret.reserve(std::distance(std::begin(range), std::end(range)));

    for(auto &&elem : range)
        ret.push_back(f(elem));

    return ret;
}

template<typename>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
constexpr bool is_optional_v = is_optional<T>::value;

namespace std
{
    inline std::ostream &operator<<(std::ostream &out, const std::exception &e)
    {
        return out << e.what();
    }

    inline std::ostream &operator<<(std::ostream &out, std::nullopt_t)
    {
        return out << "[none]";
    }

    template<typename T>
    inline std::ostream &operator<<(std::ostream &out, const std::optional<T> &opt)
    {
        if(opt)
            return out << *opt;
        else
            return out << std::nullopt;
    }

    template<typename T>
    std::ostream &operator<<(std::ostream &out, const std::vector<T> &arr)
    {
        out << "{ ";
        if(arr.size())
            out << arr[0];

        for(int i = 1; i < (int)arr.size(); i++)
            out << ", " << arr[i];
        out << " }";
        return out;
    }
}

// Failure of a Column/Table constructor: mismatched lengths, values that cannot take the requested dtype.
struct TABULA_EXPORT ConstructionError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Caller passed arguments that don't fit the data: bad mask, unknown column or group, bad bins.
struct TABULA_EXPORT UsageError : std::runtime_error
{
    using std::runtime_error::runtime_error;
};

// Absolute tolerance isin compares numbers with. Non-positive or NaN settings fall back to 1e-9,
// otherwise equal elements would never match.
inline double effectiveIsinTolerance(double tolerance)
{
    return tolerance > 0 ? tolerance : 1e-9;
}

TABULA_EXPORT bool isValidIndex(int64_t size, int64_t index);
TABULA_EXPORT void validateIndex(int64_t size, int64_t index);
TABULA_EXPORT void validateLength(const char *what, int64_t expected, int64_t actual);

template<typename T = int64_t>
std::vector<T> iotaVector(size_t N, T from = T{})
{
    std::vector<T> ret;
    ret.resize(N);
    for(auto &elem : ret)
        elem = from++;
    return ret;
}

#define THROW_AS(ExceptionType, message, ...)  do {                        \
    auto msg_ = fmt::format(message, ##__VA_ARGS__);                       \
    LOG("{}:{} {}", __FILE__, __LINE__, msg_);                             \
    throw ExceptionType{msg_};                                             \
} while(0)

#define THROW(message, ...) THROW_AS(std::runtime_error, message, ##__VA_ARGS__)

#define MAKE_INTEGRAL_CONSTANT(value) std::integral_constant<decltype(value), value>{}
#define CASE_DISPATCH(value) case value: return f(MAKE_INTEGRAL_CONSTANT(value));

