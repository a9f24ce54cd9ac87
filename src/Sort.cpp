#include "Sort.h"

#include <numeric>

#include "Execution/ExecutionContext.h"

template<typename F>
auto dispatch(SortOrder order, F &&f)
{
    switch(order)
    {
        CASE_DISPATCH(SortOrder::Ascending);
        CASE_DISPATCH(SortOrder::Descending);
    default: throw std::runtime_error(__FUNCTION__ + ": invalid value"s);
    }
}
template<typename F>
auto dispatch(NullPosition nullPosition, F &&f)
{
    switch(nullPosition)
    {
        CASE_DISPATCH(NullPosition::Before);
        CASE_DISPATCH(NullPosition::After);
    default: throw std::runtime_error(__FUNCTION__ + ": invalid value"s);
    }
}

namespace
{

template<DType id>
ColumnStorage permuteStorage(const Column &column, const Permutation &indices)
{
    using S = typename DTypeDescription<id>::StorageType;

    const auto gather = [&] (auto &source)
    {
        std::remove_const_t<std::remove_reference_t<decltype(source)>> ret;
        ret.reserve(indices.size());
        for(auto index : indices)
            ret.push_back(source[index]);
        return ret;
    };

    if(auto dense = column.denseValues<S>())
        return gather(*dense);
    return gather(std::get<BoxedStorage>(column.storage()));
}

bool isPermuteId(const Permutation &indices)
{
    for(auto i = 0_z; i < indices.size(); i++)
        if(indices[i] != (int64_t)i)
            return false;
    return true;
}

template<DType id, SortOrder order, NullPosition nulls>
void sortPermutationInner(Permutation &indices, const Column &sortBy)
{
    // Copying values out of (possibly boxed) storage once is much cheaper
    // than visiting the storage variant on each comparison.
    using ElementType = typename DTypeDescription<id>::ValueType;

    const auto compareRawValues = [](const ElementType &lhs, const ElementType &rhs)
    {
        if constexpr(order == SortOrder::Ascending)
            return lhs < rhs;
        else
            return lhs > rhs;
    };

    const auto compareValues = [=](const std::optional<ElementType> &lhs, const std::optional<ElementType> &rhs)
    {
        const auto lhsValid = lhs.has_value();
        const auto rhsValid = rhs.has_value();
        if(lhsValid && rhsValid)
            return compareRawValues(*lhs, *rhs);
        if(!lhsValid && !rhsValid) // null < null
            return false;
        if(lhsValid) // lhs < null
            return nulls == NullPosition::After;
        // null < rhs
        return nulls == NullPosition::Before;
    };

    const auto valuesAsVector = sortBy.toOptionalVector<id>();
    std::stable_sort(indices.begin(), indices.end(), [&](int64_t lhsIndex, int64_t rhsIndex)
    {
        return compareValues(valuesAsVector[lhsIndex], valuesAsVector[rhsIndex]);
    });
}

void sortPermutation(Permutation &indices, const Column &sortBy, SortOrder order, NullPosition nullPosition)
{
    // Hoist runtime constant values to the compile-time values.
    visitDType(sortBy.dtype(), [&] (auto id)
    {
        dispatch(nullPosition, [&] (auto nullPosition)
        {
            dispatch(order, [&] (auto orderC)
            {
                sortPermutationInner<id.value, orderC.value, nullPosition.value>(indices, sortBy);
            });
        });
    });
}

}

Permutation sortPermutation(std::vector<SortBy> sortBy)
{
    if(sortBy.empty())
        THROW_AS(UsageError, "no column to sort by");

    const auto length = sortBy.front().column.length();
    for(auto &key : sortBy)
        validateLength(key.column.name().c_str(), length, key.column.length());

    Permutation indices = iotaVector<int64_t>(length);

    // stable passes from the least significant key
    std::reverse(sortBy.begin(), sortBy.end());
    for(auto &key : sortBy)
        sortPermutation(indices, key.column, key.order, key.nulls);

    return indices;
}

Permutation sortIndices(const Column &column, SortOrder order, NullPosition nulls, ExecutionContext &context)
{
    return context.run("sortIndices", context.canAccelerate(column),
        [&] (AcceleratedBackend &backend)
        {
            return then(registerColumn(backend, column), [&] (OwnedHandle &handle)
            {
                return backend.sortIndices(handle, order, nulls);
            });
        },
        [&]
        {
            return sortPermutation({ SortBy{column, order, nulls} });
        });
}

Permutation sortIndices(const Column &first, const Column &second, SortOrder firstOrder, SortOrder secondOrder, NullPosition nulls, ExecutionContext &context)
{
    validateLength("second sort key", first.length(), second.length());

    const auto eligible = context.canAccelerate(first) && context.canAccelerate(second);
    return context.run("sortIndices", eligible,
        [&] (AcceleratedBackend &backend)
        {
            return then(registerColumn(backend, first), [&] (OwnedHandle &firstHandle)
            {
                return then(registerColumn(backend, second), [&] (OwnedHandle &secondHandle)
                {
                    return backend.sortIndices(firstHandle, secondHandle, firstOrder, secondOrder, nulls);
                });
            });
        },
        [&]
        {
            return sortPermutation({ SortBy{first, firstOrder, nulls}, SortBy{second, secondOrder, nulls} });
        });
}

Permutation sortIndexPermutation(const Index &index, SortOrder order)
{
    auto indices = iotaVector<int64_t>(index.size());
    std::stable_sort(indices.begin(), indices.end(), [&] (int64_t lhs, int64_t rhs)
    {
        return order == SortOrder::Ascending
            ? index[lhs] < index[rhs]
            : index[rhs] < index[lhs];
    });
    return indices;
}

Column permute(const Column &column, const Permutation &indices)
{
    if((int64_t)indices.size() == column.length() && isPermuteId(indices))
        return column;

    auto index = std::make_shared<Index>();
    index->reserve(indices.size());
    for(auto i : indices)
        index->push_back(column.index().at(i));

    auto storage = visitDType(column.dtype(), [&] (auto id) { return permuteStorage<id.value>(column, indices); });
    return Column(column.name(), column.dtype(), std::move(storage), std::move(index));
}

Table permute(const Table &table, const Permutation &indices)
{
    if((int64_t)indices.size() == table.rowCount() && isPermuteId(indices))
        return table;

    auto columns = transformToVector(table.columns(), [&] (const Column &column) { return permute(column, indices); });
    if(columns.empty())
    {
        auto index = std::make_shared<Index>();
        for(auto i : indices)
            index->push_back(table.index().at(i));
        return Table({}, std::move(index));
    }
    return Table(std::move(columns));
}

Column sortValues(const Column &column, SortOrder order, NullPosition nulls, ExecutionContext &context)
{
    return permute(column, sortIndices(column, order, nulls, context));
}

Table sortTable(const Table &table, const std::vector<SortBy> &sortBy, ExecutionContext &context)
{
    switch(sortBy.size())
    {
    case 1:
        return permute(table, sortIndices(sortBy[0].column, sortBy[0].order, sortBy[0].nulls, context));
    case 2:
        if(sortBy[0].nulls == sortBy[1].nulls)
            return permute(table, sortIndices(sortBy[0].column, sortBy[1].column, sortBy[0].order, sortBy[1].order, sortBy[0].nulls, context));
        [[fallthrough]];
    default:
        return permute(table, sortPermutation(sortBy));
    }
}
