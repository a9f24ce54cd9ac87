#include "Analysis.h"

#include <cmath>
#include <limits>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics.hpp>

#include "Sort.h"
#include "Execution/ExecutionContext.h"

namespace ba = boost::accumulators;

namespace
{

constexpr auto NaN = std::numeric_limits<double>::quiet_NaN();

// Running statistics of a single group. Non-numeric columns contribute to the non-null count only.
struct GroupStats
{
    using Accumulator = ba::accumulator_set<double, ba::stats<
        ba::tag::count,
        ba::tag::sum,
        ba::tag::min,
        ba::tag::max,
        ba::tag::mean,
        ba::tag::variance(ba::immediate)>>;

    Accumulator accumulator;
    int64_t nonNullCount = 0;

    void operator()(double value)
    {
        accumulator(value);
        nonNullCount++;
    }
    void operator()()
    {
        nonNullCount++;
    }

    double get(AggregateFunction function) const
    {
        const auto n = (int64_t)ba::count(accumulator);
        switch(function)
        {
        case AggregateFunction::Sum:      return n ? ba::sum(accumulator) : 0.0;
        case AggregateFunction::Mean:     return n ? ba::mean(accumulator) : NaN;
        case AggregateFunction::Count:    return (double)nonNullCount;
        case AggregateFunction::Minimum:  return n ? ba::min(accumulator) : NaN;
        case AggregateFunction::Maximum:  return n ? ba::max(accumulator) : NaN;
        case AggregateFunction::Variance: return sampleVariance(n);
        case AggregateFunction::StdDev:   return std::sqrt(sampleVariance(n));
        case AggregateFunction::First:
        case AggregateFunction::Last:
        case AggregateFunction::Size:
            break;
        }
        THROW("{} is not a numeric reduction", to_string(function));
    }

    double sampleVariance(int64_t n) const
    {
        // accumulator keeps the population variance
        if(n < 2)
            return NaN;
        return ba::variance(accumulator) * n / (n - 1);
    }
};

// feeds every row of the column to sink(row, stats-call), numeric dtypes by value, other dtypes by presence only
template<typename Sink>
void feedRows(const Column &column, Sink &&sink)
{
    visitDType(column.dtype(), [&] (auto id)
    {
        for(int64_t row = 0; row < column.length(); row++)
        {
            if constexpr(DTypeDescription<id.value>::numeric)
            {
                if(auto value = column.valueAt<id.value>(row))
                    sink(row, [v = (double)*value] (GroupStats &stats) { stats(v); });
            }
            else
            {
                if(!column.isNull(row))
                    sink(row, [] (GroupStats &stats) { stats(); });
            }
        }
    });
}

std::vector<GroupStats> collectGroupStats(const Column &values, const GroupPartition &partition)
{
    std::vector<GroupStats> stats(partition.groupCount());
    feedRows(values, [&] (int64_t row, auto &&add)
    {
        if(const auto group = partition.groupIds[row]; group >= 0)
            add(stats[group]);
    });
    return stats;
}

std::string resultName(const std::string &columnName, AggregateFunction function)
{
    if(columnName.empty())
        return to_string(function);
    return columnName + "_" + to_string(function);
}

// [function] => [group] => value, for numeric reductions only
using ReductionResults = std::vector<std::vector<double>>;

ReductionResults reducePortable(const Column &values, const GroupPartition &partition, const std::vector<AggregateFunction> &functions)
{
    const auto stats = collectGroupStats(values, partition);
    return transformToVector(functions, [&] (AggregateFunction function)
    {
        return transformToVector(stats, [&] (const GroupStats &group) { return group.get(function); });
    });
}

BackendResult<ReductionResults> reduceAccelerated(AcceleratedBackend &backend, const Column &values, const GroupPartition &partition, const std::vector<AggregateFunction> &functions)
{
    return then(registerColumn(backend, values), [&] (OwnedHandle &handle)
    {
        return then(backend.groupReduce(handle, partition.groupIds, (int32_t)partition.groupCount(), functions),
            [&] (std::vector<OwnedHandle> &resultHandles) -> BackendResult<ReductionResults>
        {
            ReductionResults ret;
            for(auto &resultHandle : resultHandles)
            {
                auto groupValues = backend.readFloat64(resultHandle);
                if(auto error = std::get_if<BackendError>(&groupValues))
                    return *error;

                ret.push_back(std::move(std::get<std::vector<double>>(groupValues)));
                if((int64_t)ret.back().size() != partition.groupCount())
                    return BackendError{ fmt::format("backend returned {} group values, expected {}", ret.back().size(), partition.groupCount()) };
            }
            return ret;
        });
    });
}

Column numericResultColumn(const std::string &name, AggregateFunction function, const std::vector<double> &groupValues, const IndexPtr &index)
{
    if(function == AggregateFunction::Count)
    {
        auto counts = transformToVector(groupValues, [] (double d) { return (int32_t)d; });
        return Column::fromVector(name, std::move(counts), index);
    }
    return Column::fromVector(name, groupValues, index);
}

Column boundaryRowColumn(const Column &values, const GroupPartition &partition, AggregateFunction function, const IndexPtr &index)
{
    auto rows = transformToVector(partition.rows, [&] (const std::vector<int64_t> &groupRows)
    {
        return function == AggregateFunction::First ? groupRows.front() : groupRows.back();
    });
    return permute(values, rows).withIndex(index).withName(resultName(values.name(), function));
}

}

std::string to_string(AggregateFunction a)
{
    switch(a)
    {
    case AggregateFunction::Sum:      return "sum";
    case AggregateFunction::Mean:     return "mean";
    case AggregateFunction::Count:    return "count";
    case AggregateFunction::Minimum:  return "min";
    case AggregateFunction::Maximum:  return "max";
    case AggregateFunction::StdDev:   return "std";
    case AggregateFunction::Variance: return "var";
    case AggregateFunction::First:    return "first";
    case AggregateFunction::Last:     return "last";
    case AggregateFunction::Size:     return "size";
    }
    return "unknown aggregate " + std::to_string((int)a);
}

std::ostream &operator<<(std::ostream &out, AggregateFunction a)
{
    return out << to_string(a);
}

AggregateFunction aggregateFunctionFromName(std::string_view name)
{
    for(auto a : { AggregateFunction::Sum, AggregateFunction::Mean, AggregateFunction::Count, AggregateFunction::Minimum,
                   AggregateFunction::Maximum, AggregateFunction::StdDev, AggregateFunction::Variance,
                   AggregateFunction::First, AggregateFunction::Last, AggregateFunction::Size })
    {
        if(name == to_string(a))
            return a;
    }
    THROW_AS(UsageError, "unknown aggregation function '{}'", name);
}

bool isNumericReduction(AggregateFunction a)
{
    return dispatchAggregateByEnum(a, [] (auto aC)
    {
        return aC.value != AggregateFunction::First
            && aC.value != AggregateFunction::Last
            && aC.value != AggregateFunction::Size;
    });
}

double calculateStat(const Column &column, AggregateFunction function, ExecutionContext &context)
{
    if(function == AggregateFunction::Size)
        return (double)column.length();
    if(!isNumericReduction(function))
        THROW_AS(UsageError, "{} has no scalar form, read the element instead", to_string(function));

    return context.run("calculateStat", context.canAccelerate(column),
        [&] (AcceleratedBackend &backend)
        {
            return then(registerColumn(backend, column), [&] (OwnedHandle &handle)
            {
                return backend.reduce(handle, function);
            });
        },
        [&]
        {
            GroupStats stats;
            feedRows(column, [&] (int64_t, auto &&add) { add(stats); });
            return stats.get(function);
        });
}

Column groupSizes(const GroupPartition &partition)
{
    auto sizes = transformToVector(partition.rows, [] (const std::vector<int64_t> &rows) { return (int32_t)rows.size(); });
    return Column::fromVector("size", std::move(sizes), partition.keyIndex());
}

Column reduce(const Column &values, const GroupPartition &partition, AggregateFunction function, ExecutionContext &context)
{
    return multiReduce(values, partition, { function }, context).front();
}

std::vector<Column> multiReduce(const Column &values, const GroupPartition &partition, const std::vector<AggregateFunction> &functions, ExecutionContext &context)
{
    validateLength("grouped values", partition.rowCount(), values.length());

    std::vector<AggregateFunction> numericFunctions;
    for(auto function : functions)
        if(isNumericReduction(function) && std::find(numericFunctions.begin(), numericFunctions.end(), function) == numericFunctions.end())
            numericFunctions.push_back(function);

    ReductionResults numericResults;
    if(!numericFunctions.empty())
    {
        numericResults = context.run("multiReduce", context.canAccelerate(values),
            [&] (AcceleratedBackend &backend) { return reduceAccelerated(backend, values, partition, numericFunctions); },
            [&] { return reducePortable(values, partition, numericFunctions); });
    }

    const auto index = partition.keyIndex();
    return transformToVector(functions, [&] (AggregateFunction function) -> Column
    {
        switch(function)
        {
        case AggregateFunction::First:
        case AggregateFunction::Last:
            return boundaryRowColumn(values, partition, function, index);
        case AggregateFunction::Size:
            return groupSizes(partition).withName(resultName(values.name(), function));
        default:
            break;
        }

        const auto position = std::find(numericFunctions.begin(), numericFunctions.end(), function) - numericFunctions.begin();
        return numericResultColumn(resultName(values.name(), function), function, numericResults.at(position), index);
    });
}

Table aggregateTable(const Table &table, const GroupPartition &partition, AggregateFunction function, ExecutionContext &context)
{
    auto columns = transformToVector(table.columns(), [&] (const Column &column)
    {
        return reduce(column, partition, function, context).withName(column.name());
    });
    return Table(std::move(columns), partition.keyIndex());
}

Table aggregateTable(const Table &table, const GroupPartition &partition, const AggregationSpec &spec, ExecutionContext &context)
{
    std::vector<Column> columns;
    for(auto &[name, functions] : spec)
    {
        if(functions.empty())
            THROW_AS(UsageError, "no aggregation function given for column '{}'", name);

        auto reduced = multiReduce(table.column(name), partition, functions, context);
        for(auto &column : reduced)
            columns.push_back(std::move(column));
    }
    return Table(std::move(columns), partition.keyIndex());
}
