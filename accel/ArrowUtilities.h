#pragma once

#include <memory>
#include <sstream>
#include <stdexcept>
#include <typeinfo>
#include <vector>

#include <arrow/array.h>
#include <arrow/builder.h>
#include <arrow/status.h>
#include <arrow/type.h>

template<arrow::Type::type type>
struct TypeDescription {};

template<typename T>
struct NumericTypeDescription
{
    using ArrowType = T;
    using BuilderType = arrow::NumericBuilder<T>;
    using CType = typename BuilderType::value_type;
    using Array = arrow::NumericArray<T>;
    static constexpr arrow::Type::type id = ArrowType::type_id;
};

template<> struct TypeDescription<arrow::Type::INT32 > : NumericTypeDescription<arrow::Int32Type>  {};
template<> struct TypeDescription<arrow::Type::DOUBLE> : NumericTypeDescription<arrow::DoubleType> {};

// Hoists array type to compile-time constant. Only the buffer types the backend stores are accepted.
template<typename F>
auto visitType(const arrow::DataType &type, F &&f)
{
    switch(type.id())
    {
    case arrow::Type::INT32 : return f(std::integral_constant<arrow::Type::type, arrow::Type::INT32 >{});
    case arrow::Type::DOUBLE: return f(std::integral_constant<arrow::Type::type, arrow::Type::DOUBLE>{});
    default: throw std::runtime_error("array type not supported by backend: " + type.ToString());
    }
}

inline void checkStatus(const arrow::Status &status)
{
    if(!status.ok())
        throw std::runtime_error(status.ToString());
}

template<typename To, typename From>
To throwingCast(From *from)
{
    if(auto ret = dynamic_cast<To>(from))
        return ret;

    std::ostringstream out;
    out << "Failed to cast " << from;
    if(from) // we can obtain RTTI typename for non-null pointers
        out << " being " << typeid(*from).name();

    out << " to " << typeid(std::remove_pointer_t<To>).name();

    throw std::runtime_error(out.str());
}

template<typename Function>
auto visitArray(const arrow::Array &array, Function &&f)
{
    return visitType(*array.type(), [&] (auto id)
    {
        return f(static_cast<const typename TypeDescription<id.value>::Array *>(&array));
    });
}

inline std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder &builder)
{
    std::shared_ptr<arrow::Array> ret;
    checkStatus(builder.Finish(&ret));
    return ret;
}

template<arrow::Type::type id, typename T>
std::shared_ptr<arrow::Array> toArray(const T *values, int64_t length)
{
    typename TypeDescription<id>::BuilderType builder;
    checkStatus(builder.AppendValues(values, length));
    return finish(builder);
}

template<arrow::Type::type id>
std::shared_ptr<arrow::Array> toArray(const std::vector<typename TypeDescription<id>::CType> &values)
{
    return toArray<id>(values.data(), (int64_t)values.size());
}
