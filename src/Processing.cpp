#include "Processing.h"

#include <cmath>
#include <limits>
#include <unordered_map>
#include <unordered_set>

#include "GroupBy.h"
#include "Sort.h"
#include "Execution/ExecutionContext.h"

namespace
{

Permutation maskToPositions(const Mask &mask)
{
    Permutation positions;
    for(auto i = 0_z; i < mask.size(); i++)
        if(mask[i])
            positions.push_back(i);
    return positions;
}

BackendResult<ColumnStorage> readStorage(AcceleratedBackend &backend, const OwnedHandle &handle, DType dtype)
{
    auto toStorage = [] (auto &&result) -> BackendResult<ColumnStorage>
    {
        if(auto error = std::get_if<BackendError>(&result))
            return *error;
        return ColumnStorage{ std::move(std::get<0>(result)) };
    };

    if(dtype == DType::Float64)
        return toStorage(backend.readFloat64(handle));
    if(dtype == DType::Int32)
        return toStorage(backend.readInt32(handle));
    return BackendError{ fmt::format("backend cannot hold {} values", to_string(dtype)) };
}

std::vector<double> numericCandidates(const std::vector<Value> &candidates)
{
    std::vector<double> ret;
    for(auto &candidate : candidates)
    {
        if(auto i = std::get_if<int32_t>(&candidate))
            ret.push_back(*i);
        else if(auto d = std::get_if<double>(&candidate); d && !std::isnan(*d))
            ret.push_back(*d);
    }
    return ret;
}

template<typename T>
std::vector<T> candidatesOfType(const std::vector<Value> &candidates)
{
    std::vector<T> ret;
    for(auto &candidate : candidates)
        if(auto value = std::get_if<T>(&candidate))
            ret.push_back(*value);
    return ret;
}

Column boolColumn(const Column &source, std::vector<bool> values)
{
    return Column::fromVector(source.name(), std::move(values), source.sharedIndex());
}

std::vector<bool> isinPortable(const Column &column, const std::vector<Value> &candidates, double tolerance)
{
    tolerance = effectiveIsinTolerance(tolerance);
    std::vector<bool> ret(column.length(), false);
    visitDType(column.dtype(), [&] (auto id)
    {
        using T = typename DTypeDescription<id.value>::ValueType;
        if constexpr(DTypeDescription<id.value>::numeric)
        {
            const auto numbers = numericCandidates(candidates);
            for(int64_t row = 0; row < column.length(); row++)
            {
                if(auto value = column.valueAt<id.value>(row))
                {
                    const auto v = (double)*value;
                    ret[row] = std::any_of(numbers.begin(), numbers.end(), [&] (double c) { return std::abs(v - c) < tolerance; });
                }
            }
        }
        else
        {
            const auto typed = candidatesOfType<T>(candidates);
            const std::unordered_set<T> lookup(typed.begin(), typed.end());
            for(int64_t row = 0; row < column.length(); row++)
                if(auto value = column.valueAt<id.value>(row))
                    ret[row] = lookup.count(*value) != 0;
        }
    });
    return ret;
}

std::string formatEdge(double edge)
{
    return formatDouble(edge);
}

}

Column filter(const Column &column, const Mask &mask, ExecutionContext &context)
{
    validateLength("filter mask", column.length(), mask.size());

    const auto positions = maskToPositions(mask);
    return context.run("filter", context.canAccelerate(column),
        [&] (AcceleratedBackend &backend) -> BackendResult<Column>
        {
            const auto maskBytes = transformToVector(mask, [] (bool b) { return (uint8_t)b; });
            return then(registerColumn(backend, column), [&] (OwnedHandle &handle)
            {
                return then(backend.filter(handle, maskBytes), [&] (OwnedHandle &filtered)
                {
                    return then(readStorage(backend, filtered, column.dtype()), [&] (ColumnStorage &storage) -> BackendResult<Column>
                    {
                        auto index = std::make_shared<Index>();
                        index->reserve(positions.size());
                        for(auto position : positions)
                            index->push_back(column.index()[position]);
                        return Column(column.name(), column.dtype(), std::move(storage), std::move(index));
                    });
                });
            });
        },
        [&]
        {
            return permute(column, positions);
        });
}

Table filter(const Table &table, const Mask &mask, ExecutionContext &context)
{
    validateLength("filter mask", table.rowCount(), mask.size());

    if(table.columnCount() == 0)
    {
        auto index = std::make_shared<Index>();
        for(auto position : maskToPositions(mask))
            index->push_back(table.index()[position]);
        return Table({}, std::move(index));
    }

    auto columns = transformToVector(table.columns(), [&] (const Column &column) { return filter(column, mask, context); });
    return Table(std::move(columns));
}

Column isin(const Column &column, const std::vector<Value> &candidates, ExecutionContext &context)
{
    const auto tolerance = context.config().isinTolerance;

    if(column.dtype() == DType::String)
    {
        auto values = column.denseValues<std::string>();
        return context.run("isin", values && context.canAccelerateStrings(column),
            [&] (AcceleratedBackend &backend)
            {
                return then(backend.isin(*values, candidatesOfType<std::string>(candidates)), [&] (std::vector<uint8_t> &found) -> BackendResult<Column>
                {
                    return boolColumn(column, std::vector<bool>(found.begin(), found.end()));
                });
            },
            [&]
            {
                return boolColumn(column, isinPortable(column, candidates, tolerance));
            });
    }

    return context.run("isin", context.canAccelerate(column),
        [&] (AcceleratedBackend &backend)
        {
            return then(registerColumn(backend, column), [&] (OwnedHandle &handle)
            {
                return then(backend.isin(handle, numericCandidates(candidates), tolerance), [&] (std::vector<uint8_t> &found) -> BackendResult<Column>
                {
                    return boolColumn(column, std::vector<bool>(found.begin(), found.end()));
                });
            });
        },
        [&]
        {
            return boolColumn(column, isinPortable(column, candidates, tolerance));
        });
}

Column isNull(const Column &column)
{
    std::vector<bool> ret(column.length());
    for(int64_t row = 0; row < column.length(); row++)
        ret[row] = column.isNull(row);
    return boolColumn(column, std::move(ret));
}

Column notNull(const Column &column)
{
    std::vector<bool> ret(column.length());
    for(int64_t row = 0; row < column.length(); row++)
        ret[row] = !column.isNull(row);
    return boolColumn(column, std::move(ret));
}

Column dropNA(const Column &column)
{
    if(column.nullCount() == 0)
        return column;

    Permutation positions;
    for(int64_t row = 0; row < column.length(); row++)
        if(!column.isNull(row))
            positions.push_back(row);
    return permute(column, positions);
}

Table dropNA(const Table &table)
{
    Permutation positions;
    for(int64_t row = 0; row < table.rowCount(); row++)
    {
        const auto anyNull = std::any_of(table.columns().begin(), table.columns().end(), [&] (const Column &column) { return column.isNull(row); });
        if(!anyNull)
            positions.push_back(row);
    }
    return permute(table, positions);
}

Column fillNA(const Column &column, const Value &value)
{
    if(isNull(value) || column.nullCount() == 0)
        return column;

    return visitDType(column.dtype(), [&] (auto id)
    {
        auto fill = convertValue<id.value>(value);
        if(!fill)
            THROW_AS(UsageError, "cannot fill {} column '{}' with `{}`", to_string(id.value), column.name(), toKeyString(value));

        auto values = column.toOptionalVector<id.value>();
        for(auto &element : values)
            if(!element)
                element = *fill;

        return Column::fromVector(column.name(), std::move(values), column.sharedIndex());
    });
}

Column uniqueValues(const Column &column)
{
    std::unordered_set<std::string> seen;
    std::vector<Value> unique;
    for(int64_t row = 0; row < column.length(); row++)
    {
        auto value = column.at(row);
        if(seen.insert(encodeGroupKey({ value })).second)
            unique.push_back(std::move(value));
    }

    ColumnOptions options;
    options.name = column.name();
    options.dtype = column.dtype();
    return Column(std::move(unique), std::move(options));
}

int64_t countUnique(const Column &column)
{
    std::unordered_set<std::string> seen;
    for(int64_t row = 0; row < column.length(); row++)
        if(!column.isNull(row))
            seen.insert(encodeGroupKey({ column.at(row) }));
    return (int64_t)seen.size();
}

Column countValues(const Column &column)
{
    std::unordered_map<std::string, size_t> positions;
    std::vector<std::string> keys;
    std::vector<int32_t> counts;

    for(int64_t row = 0; row < column.length(); row++)
    {
        if(column.isNull(row))
            continue;

        auto value = column.at(row);
        auto [itr, inserted] = positions.try_emplace(encodeGroupKey({ value }), keys.size());
        if(inserted)
        {
            keys.push_back(toKeyString(value));
            counts.push_back(0);
        }
        counts[itr->second]++;
    }

    auto order = iotaVector<int64_t>(keys.size());
    std::stable_sort(order.begin(), order.end(), [&] (int64_t lhs, int64_t rhs) { return counts[lhs] > counts[rhs]; });

    auto index = std::make_shared<Index>();
    std::vector<int32_t> sortedCounts;
    for(auto i : order)
    {
        index->emplace_back(keys[i]);
        sortedCounts.push_back(counts[i]);
    }
    return Column::fromVector("count", std::move(sortedCounts), std::move(index));
}

Column cut(const Column &column, const Bins &bins, const std::optional<std::vector<std::string>> &labels)
{
    const auto binCount = std::visit(overloaded{
        [] (int32_t count) -> int64_t
        {
            if(count <= 0)
                THROW_AS(UsageError, "number of bins must be positive, got {}", count);
            return count;
        },
        [] (const std::vector<double> &edges) -> int64_t
        {
            if(edges.size() < 2)
                THROW_AS(UsageError, "bin edges must have at least 2 elements, got {}", edges.size());
            for(auto i = 1_z; i < edges.size(); i++)
                if(!(edges[i] > edges[i - 1]))
                    THROW_AS(UsageError, "bin edges must be strictly ascending, {} follows {}", edges[i], edges[i - 1]);
            return (int64_t)edges.size() - 1;
        }
    }, bins);

    if(labels && (int64_t)labels->size() != binCount)
        THROW_AS(UsageError, "number of labels ({}) must match number of bins ({})", labels->size(), binCount);

    if(!isNumeric(column.dtype()))
        THROW_AS(UsageError, "cannot bin {} column '{}', numeric column required", to_string(column.dtype()), column.name());

    std::vector<std::optional<double>> values(column.length());
    visitDType(column.dtype(), [&] (auto id)
    {
        if constexpr(DTypeDescription<id.value>::numeric)
            for(int64_t row = 0; row < column.length(); row++)
                if(auto value = column.valueAt<id.value>(row))
                    values[row] = (double)*value;
    });

    const auto name = column.name() + "_cut";
    std::vector<std::optional<std::string>> result(column.length());

    const auto present = std::count_if(values.begin(), values.end(), [] (auto &v) { return v.has_value(); });
    if(present == 0)
        return Column::fromVector(name, std::move(result), column.sharedIndex());

    std::vector<double> edges;
    if(auto count = std::get_if<int32_t>(&bins))
    {
        double lowest = std::numeric_limits<double>::infinity();
        double highest = -std::numeric_limits<double>::infinity();
        for(auto &v : values)
        {
            if(v)
            {
                lowest = std::min(lowest, *v);
                highest = std::max(highest, *v);
            }
        }

        const auto step = (highest - lowest) / *count;
        for(int32_t i = 0; i <= *count; i++)
            edges.push_back(lowest + i * step);
    }
    else
        edges = std::get<std::vector<double>>(bins);

    for(int64_t row = 0; row < column.length(); row++)
    {
        if(!values[row])
            continue;

        const auto v = *values[row];
        for(auto bin = 0_z; bin + 1 < edges.size(); bin++)
        {
            const auto isFirstBin = bin == 0;
            const auto leftMatch = isFirstBin ? v >= edges[bin] : v > edges[bin];
            if(leftMatch && v <= edges[bin + 1])
            {
                result[row] = labels
                    ? (*labels)[bin]
                    : fmt::format("{}{}, {}]", isFirstBin ? "[" : "(", formatEdge(edges[bin]), formatEdge(edges[bin + 1]));
                break;
            }
        }
    }

    return Column::fromVector(name, std::move(result), column.sharedIndex());
}
