#pragma once

#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Core/Common.h"
#include "Core/DType.h"
#include "Core/Value.h"

class ExecutionContext;
class ColumnGroupBy;
struct GroupOptions;
struct KeySpec;

using Index = std::vector<Label>;
using IndexPtr = std::shared_ptr<const Index>;
using Mask = std::vector<bool>;

// Dense alternatives hold no nulls (except NaN in doubles), boxed values may hold the null marker.
using BoxedStorage = std::vector<Value>;
using ColumnStorage = std::variant<
    std::vector<int32_t>,
    std::vector<double>,
    std::vector<std::string>,
    std::vector<uint8_t>,
    std::vector<Timestamp>,
    BoxedStorage>;

struct ColumnOptions
{
    std::optional<std::string> name;
    std::optional<DType> dtype;
    std::optional<Index> index;
};

TABULA_EXPORT IndexPtr defaultIndex(int64_t length);

// Named, typed and indexed sequence of values. Immutable once constructed,
// copies share storage and index.
class TABULA_EXPORT Column
{
    std::string name_;
    DType dtype_ = DType::String;
    IndexPtr index_;
    std::shared_ptr<const ColumnStorage> storage_;
    int64_t nullCount_ = 0;

public:
    Column();
    explicit Column(std::vector<Value> values, ColumnOptions options = {});
    Column(std::string name, DType dtype, ColumnStorage storage, IndexPtr index = nullptr);

    // T is an element type (int32_t, double, std::string, bool, Timestamp) or std::optional of one
    template<typename T>
    static Column fromVector(std::string name, std::vector<T> values, IndexPtr index = nullptr);

    const std::string &name() const { return name_; }
    DType dtype() const { return dtype_; }
    int64_t length() const { return (int64_t)index_->size(); }
    const Index &index() const { return *index_; }
    const IndexPtr &sharedIndex() const { return index_; }
    const ColumnStorage &storage() const { return *storage_; }

    int64_t nullCount() const { return nullCount_; }
    bool isBoxed() const { return std::holds_alternative<BoxedStorage>(*storage_); }

    // nullptr unless storage is dense vector<T>
    template<typename T>
    const std::vector<T> *denseValues() const { return std::get_if<std::vector<T>>(storage_.get()); }

    // unchecked typed read, id must equal dtype()
    template<DType id>
    std::optional<typename DTypeDescription<id>::ValueType> valueAt(int64_t row) const;

    template<DType id>
    std::vector<std::optional<typename DTypeDescription<id>::ValueType>> toOptionalVector() const;

    bool isNull(int64_t row) const;
    Value at(int64_t row) const;
    Value loc(const Label &label) const;
    std::vector<Value> values() const;

    Column withName(std::string name) const;
    Column withIndex(IndexPtr index) const;
    Column resetIndex() const;

    Column filter(const Mask &mask) const;
    Column filter(const Mask &mask, ExecutionContext &context) const;
    Column isin(const std::vector<Value> &candidates) const;
    Column isin(const std::vector<Value> &candidates, ExecutionContext &context) const;

    double sum() const;
    double sum(ExecutionContext &context) const;
    double mean() const;
    double mean(ExecutionContext &context) const;
    double stdDev() const;
    double stdDev(ExecutionContext &context) const;
    double var() const;
    double var(ExecutionContext &context) const;
    double min() const;
    double min(ExecutionContext &context) const;
    double max() const;
    double max(ExecutionContext &context) const;
    int64_t count() const;
    int64_t count(ExecutionContext &context) const;

    // nulls always go last
    Column sortValues(bool ascending = true) const;
    Column sortValues(bool ascending, ExecutionContext &context) const;
    Column sortIndex(bool ascending = true) const;

    Column isnull() const;
    Column notnull() const;
    Column dropna() const;
    Column fillna(const Value &value) const;
    Column unique() const;
    int64_t nunique() const;
    Column valueCounts() const;

    ColumnGroupBy groupBy(const KeySpec &keys) const;
    ColumnGroupBy groupBy(const KeySpec &keys, const GroupOptions &options) const;
};

template<DType id>
std::optional<typename DTypeDescription<id>::ValueType> Column::valueAt(int64_t row) const
{
    using T = typename DTypeDescription<id>::ValueType;
    using S = typename DTypeDescription<id>::StorageType;

    if(auto boxed = std::get_if<BoxedStorage>(storage_.get()))
    {
        if(auto value = std::get_if<T>(&(*boxed)[row]))
            return *value;
        return std::nullopt;
    }

    const auto &dense = std::get<std::vector<S>>(*storage_);
    if constexpr(id == DType::Float64)
    {
        if(std::isnan(dense[row]))
            return std::nullopt;
        return dense[row];
    }
    else if constexpr(id == DType::Bool)
        return dense[row] != 0;
    else
        return dense[row];
}

template<DType id>
std::vector<std::optional<typename DTypeDescription<id>::ValueType>> Column::toOptionalVector() const
{
    std::vector<std::optional<typename DTypeDescription<id>::ValueType>> ret;
    ret.reserve(length());
    for(int64_t row = 0; row < length(); row++)
        ret.push_back(valueAt<id>(row));
    return ret;
}

template<typename T>
Column Column::fromVector(std::string name, std::vector<T> values, IndexPtr index)
{
    if constexpr(is_optional_v<T>)
    {
        using V = typename T::value_type;
        constexpr DType id = dtypeOf<V>;
        using S = typename DTypeDescription<id>::StorageType;

        if constexpr(id == DType::Float64)
        {
            auto dense = transformToVector(values, [] (const auto &v)
            {
                return v.value_or(std::numeric_limits<double>::quiet_NaN());
            });
            return Column(std::move(name), id, std::move(dense), std::move(index));
        }
        else
        {
            const auto anyNull = std::any_of(values.begin(), values.end(), [] (const auto &v) { return !v.has_value(); });
            if(!anyNull)
            {
                auto dense = transformToVector(values, [] (const auto &v) { return static_cast<S>(*v); });
                return Column(std::move(name), id, std::move(dense), std::move(index));
            }

            auto boxed = transformToVector(values, [] (auto &v) -> Value
            {
                if(v)
                    return std::move(*v);
                return std::nullopt;
            });
            return Column(std::move(name), id, std::move(boxed), std::move(index));
        }
    }
    else
    {
        constexpr DType id = dtypeOf<T>;
        if constexpr(id == DType::Bool)
        {
            auto dense = transformToVector(values, [] (bool b) { return (uint8_t)b; });
            return Column(std::move(name), id, std::move(dense), std::move(index));
        }
        else
            return Column(std::move(name), id, std::move(values), std::move(index));
    }
}

// Calls onValue(value) for each non-null element and onNull() for each null, in row order.
template<DType id, typename ElementF, typename NullF>
void iterateOver(const Column &column, ElementF &&onValue, NullF &&onNull)
{
    const auto N = column.length();
    for(int64_t row = 0; row < N; row++)
    {
        if(auto value = column.valueAt<id>(row))
            onValue(*value);
        else
            onNull();
    }
}
