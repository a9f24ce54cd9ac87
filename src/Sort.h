#pragma once

#include <vector>

#include "Core/Common.h"
#include "Column.h"
#include "Table.h"

class ExecutionContext;

enum class SortOrder : uint8_t
{
    Ascending, Descending
};

enum class NullPosition : uint8_t
{
    Before, After
};

using Permutation = std::vector<int64_t>; // [new index] -> old index

struct SortBy
{
    Column column;
    SortOrder order;
    NullPosition nulls;

    SortBy(Column column, SortOrder order = SortOrder::Ascending, NullPosition nulls = NullPosition::After)
        : column(std::move(column)), order(order), nulls(nulls)
    {}
};

// Stable ordering by the given keys, first key is the most significant. Always runs in-process.
TABULA_EXPORT Permutation sortPermutation(std::vector<SortBy> sortBy);

TABULA_EXPORT Permutation sortIndices(const Column &column, SortOrder order, NullPosition nulls, ExecutionContext &context);
TABULA_EXPORT Permutation sortIndices(const Column &first, const Column &second, SortOrder firstOrder, SortOrder secondOrder, NullPosition nulls, ExecutionContext &context);
TABULA_EXPORT Permutation sortIndexPermutation(const Index &index, SortOrder order);

// Gathers rows, carrying the index labels along.
TABULA_EXPORT Column permute(const Column &column, const Permutation &indices);
TABULA_EXPORT Table permute(const Table &table, const Permutation &indices);

TABULA_EXPORT Column sortValues(const Column &column, SortOrder order, NullPosition nulls, ExecutionContext &context);
TABULA_EXPORT Table sortTable(const Table &table, const std::vector<SortBy> &sortBy, ExecutionContext &context);
