#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Core/Common.h"
#include "Column.h"
#include "GroupBy.h"
#include "Table.h"

class ExecutionContext;

enum class AggregateFunction : int8_t
{
    Sum, Mean, Count, Minimum, Maximum, StdDev, Variance, First, Last, Size
};

template<typename Function>
auto dispatchAggregateByEnum(AggregateFunction aggregateEnum, Function &&f)
{
    switch(aggregateEnum)
    {
    CASE_DISPATCH(AggregateFunction::Sum)
    CASE_DISPATCH(AggregateFunction::Mean)
    CASE_DISPATCH(AggregateFunction::Count)
    CASE_DISPATCH(AggregateFunction::Minimum)
    CASE_DISPATCH(AggregateFunction::Maximum)
    CASE_DISPATCH(AggregateFunction::StdDev)
    CASE_DISPATCH(AggregateFunction::Variance)
    CASE_DISPATCH(AggregateFunction::First)
    CASE_DISPATCH(AggregateFunction::Last)
    CASE_DISPATCH(AggregateFunction::Size)
    }
    throw std::runtime_error("not supported aggregate function " + std::to_string((int)aggregateEnum));
}

TABULA_EXPORT std::string to_string(AggregateFunction a);
TABULA_EXPORT std::ostream &operator<<(std::ostream &out, AggregateFunction a);

// Accepts sum, mean, count, min, max, std, var, first, last, size. Anything else is a UsageError.
TABULA_EXPORT AggregateFunction aggregateFunctionFromName(std::string_view name);

// Reductions the accelerated backend can compute. First, last and size are always computed in-process.
TABULA_EXPORT bool isNumericReduction(AggregateFunction a);

// Scalar statistic over non-null numeric values. NaN for mean/min/max of nothing,
// NaN for std/var of less than two values, 0 for sum of nothing.
TABULA_EXPORT double calculateStat(const Column &column, AggregateFunction function, ExecutionContext &context);

TABULA_EXPORT Column groupSizes(const GroupPartition &partition);

// One value per group, in partition order. Result is named "<column>_<function>" and indexed by group keys.
TABULA_EXPORT Column reduce(const Column &values, const GroupPartition &partition, AggregateFunction function, ExecutionContext &context);

// Same results as calling reduce for each function, computed in a single pass.
TABULA_EXPORT std::vector<Column> multiReduce(const Column &values, const GroupPartition &partition, const std::vector<AggregateFunction> &functions, ExecutionContext &context);

TABULA_EXPORT Table aggregateTable(const Table &table, const GroupPartition &partition, AggregateFunction function, ExecutionContext &context);
TABULA_EXPORT Table aggregateTable(const Table &table, const GroupPartition &partition, const AggregationSpec &spec, ExecutionContext &context);
