#pragma once

#include <string>
#include <string_view>

#include "Common.h"
#include "Timestamp.h"

enum class DType : uint8_t
{
    Int32, Float64, String, Bool, DateTime
};

// ValueType is what a single element reads as, StorageType is what dense storage keeps.
template<DType id>
struct DTypeDescription {};

template<> struct DTypeDescription<DType::Int32>
{
    using ValueType = int32_t;
    using StorageType = int32_t;
    static constexpr const char *name = "int32";
    static constexpr bool numeric = true;
};

template<> struct DTypeDescription<DType::Float64>
{
    using ValueType = double;
    using StorageType = double;
    static constexpr const char *name = "float64";
    static constexpr bool numeric = true;
};

template<> struct DTypeDescription<DType::String>
{
    using ValueType = std::string;
    using StorageType = std::string;
    static constexpr const char *name = "string";
    static constexpr bool numeric = false;
};

template<> struct DTypeDescription<DType::Bool>
{
    using ValueType = bool;
    using StorageType = uint8_t;
    static constexpr const char *name = "bool";
    static constexpr bool numeric = false;
};

template<> struct DTypeDescription<DType::DateTime>
{
    using ValueType = Timestamp;
    using StorageType = Timestamp;
    static constexpr const char *name = "datetime";
    static constexpr bool numeric = false;
};

template<typename T>
struct ValueTypeDType {};
template<> struct ValueTypeDType<int32_t>     { static constexpr DType value = DType::Int32;    };
template<> struct ValueTypeDType<double>      { static constexpr DType value = DType::Float64;  };
template<> struct ValueTypeDType<std::string> { static constexpr DType value = DType::String;   };
template<> struct ValueTypeDType<bool>        { static constexpr DType value = DType::Bool;     };
template<> struct ValueTypeDType<Timestamp>   { static constexpr DType value = DType::DateTime; };

template<typename T>
constexpr DType dtypeOf = ValueTypeDType<T>::value;

// Hoists runtime dtype to compile-time constant, f is called with std::integral_constant<DType, ...>
template<typename F>
auto visitDType(DType id, F &&f)
{
    switch(id)
    {
        CASE_DISPATCH(DType::Int32)
        CASE_DISPATCH(DType::Float64)
        CASE_DISPATCH(DType::String)
        CASE_DISPATCH(DType::Bool)
        CASE_DISPATCH(DType::DateTime)
    }
    throw std::runtime_error("invalid dtype value " + std::to_string((int)id));
}

TABULA_EXPORT bool isNumeric(DType id);
TABULA_EXPORT const char *to_string(DType id);
TABULA_EXPORT std::ostream &operator<<(std::ostream &out, DType id);

// Unrecognized names give DType::String.
TABULA_EXPORT DType dtypeFromName(std::string_view name);
