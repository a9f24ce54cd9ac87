#include "Column.h"

#include "Analysis.h"
#include "GroupBy.h"
#include "Processing.h"
#include "Sort.h"
#include "Execution/ExecutionContext.h"

namespace
{

DType inferColumnDType(const std::vector<Value> &values)
{
    std::optional<DType> found;
    for(auto &value : values)
    {
        const auto valueType = inferDType(value);
        if(!valueType)
            continue;

        if(!found)
            found = valueType;
        else if(*found != *valueType)
            return DType::String;
    }
    return found.value_or(DType::String);
}

template<DType id>
ColumnStorage buildStorage(const std::vector<Value> &values)
{
    using T = typename DTypeDescription<id>::ValueType;
    using S = typename DTypeDescription<id>::StorageType;

    std::vector<std::optional<T>> converted;
    converted.reserve(values.size());
    bool hasNulls = false;

    for(auto &value : values)
    {
        if(isNull(value))
        {
            hasNulls = true;
            converted.push_back(std::nullopt);
            continue;
        }

        auto element = convertValue<id>(value);
        if(!element)
            THROW_AS(ConstructionError, "cannot convert value `{}` to {}", toKeyString(value), to_string(id));
        converted.push_back(std::move(*element));
    }

    if constexpr(id == DType::Float64)
    {
        return transformToVector(converted, [] (auto &v) { return v.value_or(std::numeric_limits<double>::quiet_NaN()); });
    }
    else if(!hasNulls)
    {
        return transformToVector(converted, [] (auto &v) { return static_cast<S>(std::move(*v)); });
    }
    else
    {
        return transformToVector(converted, [] (auto &v) -> Value
        {
            if(v)
                return std::move(*v);
            return std::nullopt;
        });
    }
}

// Checks that storage matches dtype, unboxes float64 and counts nulls.
template<DType id>
int64_t normalizeStorage(ColumnStorage &storage)
{
    using T = typename DTypeDescription<id>::ValueType;
    using S = typename DTypeDescription<id>::StorageType;

    if(auto boxed = std::get_if<BoxedStorage>(&storage))
    {
        int64_t nullCount = 0;
        for(auto &value : *boxed)
        {
            if(isNull(value))
                nullCount++;
            else if(!std::holds_alternative<T>(value))
                THROW_AS(ConstructionError, "boxed value `{}` does not match column type {}", toKeyString(value), to_string(id));
        }

        if constexpr(id == DType::Float64)
        {
            storage = transformToVector(*boxed, [] (const Value &value)
            {
                if(auto d = std::get_if<double>(&value))
                    return *d;
                return std::numeric_limits<double>::quiet_NaN();
            });
        }
        return nullCount;
    }

    if(!std::holds_alternative<std::vector<S>>(storage))
        THROW_AS(ConstructionError, "storage does not match column type {}", to_string(id));

    if constexpr(id == DType::Float64)
    {
        auto &dense = std::get<std::vector<double>>(storage);
        return std::count_if(dense.begin(), dense.end(), [] (double d) { return std::isnan(d); });
    }
    else
        return 0;
}

int64_t storageLength(const ColumnStorage &storage)
{
    return std::visit([] (auto &vector) { return (int64_t)vector.size(); }, storage);
}

}

IndexPtr defaultIndex(int64_t length)
{
    auto index = std::make_shared<Index>();
    index->reserve(length);
    for(int64_t i = 0; i < length; i++)
        index->emplace_back(i);
    return index;
}

Column::Column()
    : Column(std::vector<Value>{})
{
}

Column::Column(std::vector<Value> values, ColumnOptions options)
{
    if(options.index && options.index->size() != values.size())
        THROW_AS(ConstructionError, "length mismatch: index has {} labels, values have {} elements", options.index->size(), values.size());

    name_ = options.name.value_or("");
    dtype_ = options.dtype ? *options.dtype : inferColumnDType(values);
    index_ = options.index
        ? std::make_shared<const Index>(std::move(*options.index))
        : defaultIndex(values.size());

    auto storage = visitDType(dtype_, [&] (auto id) { return buildStorage<id.value>(values); });
    nullCount_ = visitDType(dtype_, [&] (auto id) { return normalizeStorage<id.value>(storage); });
    storage_ = std::make_shared<const ColumnStorage>(std::move(storage));
}

Column::Column(std::string name, DType dtype, ColumnStorage storage, IndexPtr index)
    : name_(std::move(name))
    , dtype_(dtype)
{
    const auto length = storageLength(storage);
    if(!index)
        index = defaultIndex(length);
    else if((int64_t)index->size() != length)
        THROW_AS(ConstructionError, "length mismatch: index has {} labels, values have {} elements", index->size(), length);

    index_ = std::move(index);
    nullCount_ = visitDType(dtype_, [&] (auto id) { return normalizeStorage<id.value>(storage); });
    storage_ = std::make_shared<const ColumnStorage>(std::move(storage));
}

bool Column::isNull(int64_t row) const
{
    return visitDType(dtype_, [&] (auto id) { return !valueAt<id.value>(row).has_value(); });
}

Value Column::at(int64_t row) const
{
    validateIndex(length(), row);
    return visitDType(dtype_, [&] (auto id) -> Value
    {
        if(auto value = valueAt<id.value>(row))
            return std::move(*value);
        return std::nullopt;
    });
}

Value Column::loc(const Label &label) const
{
    const auto itr = std::find(index_->begin(), index_->end(), label);
    if(itr == index_->end())
        THROW_AS(UsageError, "label '{}' not found in column '{}'", to_string(label), name_);
    return at(std::distance(index_->begin(), itr));
}

std::vector<Value> Column::values() const
{
    std::vector<Value> ret;
    ret.reserve(length());
    for(int64_t row = 0; row < length(); row++)
        ret.push_back(at(row));
    return ret;
}

Column Column::withName(std::string name) const
{
    auto ret = *this;
    ret.name_ = std::move(name);
    return ret;
}

Column Column::withIndex(IndexPtr index) const
{
    if(!index || (int64_t)index->size() != length())
        THROW_AS(ConstructionError, "length mismatch: index has {} labels, column '{}' has {} elements", index ? index->size() : 0, name_, length());

    auto ret = *this;
    ret.index_ = std::move(index);
    return ret;
}

Column Column::resetIndex() const
{
    return withIndex(defaultIndex(length()));
}

Column Column::filter(const Mask &mask) const
{
    ExecutionContext context;
    return filter(mask, context);
}

Column Column::filter(const Mask &mask, ExecutionContext &context) const
{
    return ::filter(*this, mask, context);
}

Column Column::isin(const std::vector<Value> &candidates) const
{
    ExecutionContext context;
    return isin(candidates, context);
}

Column Column::isin(const std::vector<Value> &candidates, ExecutionContext &context) const
{
    return ::isin(*this, candidates, context);
}

double Column::sum() const
{
    ExecutionContext context;
    return sum(context);
}

double Column::sum(ExecutionContext &context) const
{
    return calculateStat(*this, AggregateFunction::Sum, context);
}

double Column::mean() const
{
    ExecutionContext context;
    return mean(context);
}

double Column::mean(ExecutionContext &context) const
{
    return calculateStat(*this, AggregateFunction::Mean, context);
}

double Column::stdDev() const
{
    ExecutionContext context;
    return stdDev(context);
}

double Column::stdDev(ExecutionContext &context) const
{
    return calculateStat(*this, AggregateFunction::StdDev, context);
}

double Column::var() const
{
    ExecutionContext context;
    return var(context);
}

double Column::var(ExecutionContext &context) const
{
    return calculateStat(*this, AggregateFunction::Variance, context);
}

double Column::min() const
{
    ExecutionContext context;
    return min(context);
}

double Column::min(ExecutionContext &context) const
{
    return calculateStat(*this, AggregateFunction::Minimum, context);
}

double Column::max() const
{
    ExecutionContext context;
    return max(context);
}

double Column::max(ExecutionContext &context) const
{
    return calculateStat(*this, AggregateFunction::Maximum, context);
}

int64_t Column::count() const
{
    ExecutionContext context;
    return count(context);
}

int64_t Column::count(ExecutionContext &context) const
{
    return (int64_t)calculateStat(*this, AggregateFunction::Count, context);
}

Column Column::sortValues(bool ascending) const
{
    ExecutionContext context;
    return sortValues(ascending, context);
}

Column Column::sortValues(bool ascending, ExecutionContext &context) const
{
    return ::sortValues(*this, ascending ? SortOrder::Ascending : SortOrder::Descending, NullPosition::After, context);
}

Column Column::sortIndex(bool ascending) const
{
    return permute(*this, sortIndexPermutation(index(), ascending ? SortOrder::Ascending : SortOrder::Descending));
}

Column Column::isnull() const
{
    return ::isNull(*this);
}

Column Column::notnull() const
{
    return ::notNull(*this);
}

Column Column::dropna() const
{
    return dropNA(*this);
}

Column Column::fillna(const Value &value) const
{
    return fillNA(*this, value);
}

Column Column::unique() const
{
    return uniqueValues(*this);
}

int64_t Column::nunique() const
{
    return countUnique(*this);
}

Column Column::valueCounts() const
{
    return countValues(*this);
}

ColumnGroupBy Column::groupBy(const KeySpec &keys) const
{
    return groupBy(keys, GroupOptions{});
}

ColumnGroupBy Column::groupBy(const KeySpec &keys, const GroupOptions &options) const
{
    return ColumnGroupBy(*this, buildGroups(*this, keys, options));
}
