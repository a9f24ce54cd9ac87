#include "GroupBy.h"

#include <cstring>
#include <numeric>
#include <tuple>

#include "Analysis.h"
#include "Processing.h"
#include "Sort.h"
#include "Execution/ExecutionContext.h"

namespace
{

template<typename T>
void appendFixed(std::string &out, const T &value)
{
    char bytes[sizeof(T)];
    std::memcpy(bytes, &value, sizeof(T));
    out.append(bytes, sizeof(T));
}

std::string joinKey(const std::vector<Value> &components)
{
    std::string ret;
    for(auto i = 0_z; i < components.size(); i++)
    {
        if(i)
            ret += '|';
        ret += toKeyString(components[i]);
    }
    return ret;
}

Value labelToValue(const Label &label)
{
    return std::visit(overloaded{
        [] (int64_t i) -> Value
        {
            if(i >= std::numeric_limits<int32_t>::min() && i <= std::numeric_limits<int32_t>::max())
                return (int32_t)i;
            return std::to_string(i);
        },
        [] (const std::string &s) -> Value { return s; }
    }, label);
}

// readKey(row, components) appends the key components of the given row
template<typename KeyReader>
GroupPartition partitionRows(int64_t rowCount, const GroupOptions &options, KeyReader &&readKey)
{
    GroupPartition ret;
    ret.groupIds.assign(rowCount, -1);

    std::unordered_map<std::string, int32_t> encodedToGroup;
    std::vector<std::string> encodedKeys;
    std::vector<Value> components;

    for(int64_t row = 0; row < rowCount; row++)
    {
        components.clear();
        readKey(row, components);

        const auto hasNullComponent = std::any_of(components.begin(), components.end(), [] (const Value &v) { return isNull(v); });
        if(hasNullComponent && options.dropna)
            continue;

        auto encoded = encodeGroupKey(components);
        auto [itr, inserted] = encodedToGroup.try_emplace(encoded, (int32_t)ret.keys.size());
        if(inserted)
        {
            ret.keys.push_back(joinKey(components));
            ret.rows.emplace_back();
            encodedKeys.push_back(std::move(encoded));
        }

        ret.rows[itr->second].push_back(row);
        ret.groupIds[row] = itr->second;
    }

    if(options.sort)
    {
        auto order = iotaVector<int32_t>(ret.keys.size());
        std::stable_sort(order.begin(), order.end(), [&] (int32_t lhs, int32_t rhs)
        {
            return std::tie(ret.keys[lhs], encodedKeys[lhs]) < std::tie(ret.keys[rhs], encodedKeys[rhs]);
        });

        std::vector<int32_t> newPosition(order.size());
        for(auto i = 0_z; i < order.size(); i++)
            newPosition[order[i]] = (int32_t)i;

        auto keys = transformToVector(order, [&] (int32_t group) { return std::move(ret.keys[group]); });
        auto rows = transformToVector(order, [&] (int32_t group) { return std::move(ret.rows[group]); });
        ret.keys = std::move(keys);
        ret.rows = std::move(rows);
        for(auto &groupId : ret.groupIds)
            if(groupId >= 0)
                groupId = newPosition[groupId];
    }

    for(auto i = 0_z; i < ret.keys.size(); i++)
        ret.lookup.try_emplace(ret.keys[i], (int32_t)i);

    return ret;
}

GroupPartition partitionByValues(int64_t rowCount, const std::vector<Value> &keys, const GroupOptions &options)
{
    validateLength("group keys", rowCount, keys.size());
    return partitionRows(rowCount, options, [&] (int64_t row, std::vector<Value> &components)
    {
        components.push_back(keys[row]);
    });
}

GroupPartition partitionByIndex(const Index &index, const GroupOptions &options)
{
    return partitionRows(index.size(), options, [&] (int64_t row, std::vector<Value> &components)
    {
        components.push_back(labelToValue(index[row]));
    });
}

GroupPartition partitionByFunction(int64_t rowCount, const RowKeyFunction &function, const GroupOptions &options)
{
    return partitionRows(rowCount, options, [&] (int64_t row, std::vector<Value> &components)
    {
        components.push_back(function(row));
    });
}

GroupPartition partitionByColumns(const std::vector<Column> &keyColumns, int64_t rowCount, const GroupOptions &options)
{
    if(keyColumns.empty())
        THROW_AS(UsageError, "at least one group key column is required");

    return partitionRows(rowCount, options, [&] (int64_t row, std::vector<Value> &components)
    {
        for(auto &column : keyColumns)
            components.push_back(column.at(row));
    });
}

}

std::optional<int32_t> GroupPartition::find(const std::string &key) const
{
    if(auto itr = lookup.find(key); itr != lookup.end())
        return itr->second;
    return std::nullopt;
}

const std::vector<int64_t> &GroupPartition::rowsOf(const std::string &key) const
{
    if(auto group = find(key))
        return rows[*group];
    THROW_AS(UsageError, "group '{}' not found", key);
}

std::map<std::string, std::vector<int64_t>> GroupPartition::toMap() const
{
    std::map<std::string, std::vector<int64_t>> ret;
    for(auto i = 0_z; i < keys.size(); i++)
    {
        auto &target = ret[keys[i]];
        target.insert(target.end(), rows[i].begin(), rows[i].end());
    }
    for(auto &entry : ret)
        std::sort(entry.second.begin(), entry.second.end());
    return ret;
}

IndexPtr GroupPartition::keyIndex() const
{
    auto index = std::make_shared<Index>();
    index->reserve(keys.size());
    for(auto &key : keys)
        index->emplace_back(key);
    return index;
}

std::string encodeGroupKey(const std::vector<Value> &components)
{
    // one tag byte per component, then a fixed-width payload (strings: 4-byte length + bytes)
    std::string ret;
    for(auto &component : components)
    {
        if(isNull(component))
        {
            ret += '\0';
            continue;
        }

        ret += (char)(1 + component.index());
        std::visit(overloaded{
            [] (std::nullopt_t) {},
            [&] (int32_t i) { appendFixed(ret, i); },
            [&] (double d) { appendFixed(ret, d); },
            [&] (const std::string &s)
            {
                appendFixed(ret, (uint32_t)s.size());
                ret += s;
            },
            [&] (bool b) { ret += (char)b; },
            [&] (const Timestamp &t) { appendFixed(ret, t.toStorage()); }
        }, component);
    }
    return ret;
}

GroupPartition buildGroups(const Column &column, const KeySpec &keys, const GroupOptions &options)
{
    return std::visit(overloaded{
        [&] (UseIndex) { return partitionByIndex(column.index(), options); },
        [&] (const std::vector<Value> &values) { return partitionByValues(column.length(), values, options); },
        [&] (const RowKeyFunction &function) { return partitionByFunction(column.length(), function, options); },
        [&] (const std::string &name) -> GroupPartition
        {
            THROW_AS(UsageError, "cannot group column '{}' by column name '{}', named keys require a table", column.name(), name);
        },
        [&] (const std::vector<std::string> &) -> GroupPartition
        {
            THROW_AS(UsageError, "cannot group column '{}' by column names, named keys require a table", column.name());
        }
    }, keys.spec);
}

GroupPartition buildGroups(const Table &table, const KeySpec &keys, const GroupOptions &options)
{
    return std::visit(overloaded{
        [&] (UseIndex) { return partitionByIndex(table.index(), options); },
        [&] (const std::vector<Value> &values) { return partitionByValues(table.rowCount(), values, options); },
        [&] (const RowKeyFunction &function) { return partitionByFunction(table.rowCount(), function, options); },
        [&] (const std::string &name) { return partitionByColumns({ table.column(name) }, table.rowCount(), options); },
        [&] (const std::vector<std::string> &names)
        {
            auto keyColumns = transformToVector(names, [&] (const std::string &name) { return table.column(name); });
            return partitionByColumns(keyColumns, table.rowCount(), options);
        }
    }, keys.spec);
}

ColumnGroupBy::ColumnGroupBy(Column column, GroupPartition partition)
    : column_(std::move(column))
    , partition_(std::move(partition))
{
}

Column ColumnGroupBy::getGroup(const std::string &key) const
{
    return permute(column_, partition_.rowsOf(key));
}

Column ColumnGroupBy::size() const
{
    return groupSizes(partition_);
}

Column ColumnGroupBy::agg(AggregateFunction function) const
{
    ExecutionContext context;
    return agg(function, context);
}

Column ColumnGroupBy::agg(AggregateFunction function, ExecutionContext &context) const
{
    return reduce(column_, partition_, function, context);
}

Column ColumnGroupBy::agg(const std::string &function) const
{
    return agg(aggregateFunctionFromName(function));
}

Table ColumnGroupBy::agg(const std::vector<AggregateFunction> &functions) const
{
    ExecutionContext context;
    return agg(functions, context);
}

Table ColumnGroupBy::agg(const std::vector<AggregateFunction> &functions, ExecutionContext &context) const
{
    return Table(multiReduce(column_, partition_, functions, context), partition_.keyIndex());
}

Column ColumnGroupBy::sum() const    { return agg(AggregateFunction::Sum); }
Column ColumnGroupBy::mean() const   { return agg(AggregateFunction::Mean); }
Column ColumnGroupBy::count() const  { return agg(AggregateFunction::Count); }
Column ColumnGroupBy::min() const    { return agg(AggregateFunction::Minimum); }
Column ColumnGroupBy::max() const    { return agg(AggregateFunction::Maximum); }
Column ColumnGroupBy::stdDev() const { return agg(AggregateFunction::StdDev); }
Column ColumnGroupBy::var() const    { return agg(AggregateFunction::Variance); }
Column ColumnGroupBy::first() const  { return agg(AggregateFunction::First); }
Column ColumnGroupBy::last() const   { return agg(AggregateFunction::Last); }

TableGroupBy::TableGroupBy(Table table, GroupPartition partition)
    : table_(std::move(table))
    , partition_(std::move(partition))
{
}

Table TableGroupBy::getGroup(const std::string &key) const
{
    return permute(table_, partition_.rowsOf(key));
}

Column TableGroupBy::size() const
{
    return groupSizes(partition_);
}

ColumnGroupBy TableGroupBy::operator[](const std::string &column) const
{
    return ColumnGroupBy(table_.column(column), partition_);
}

Table TableGroupBy::agg(AggregateFunction function) const
{
    ExecutionContext context;
    return agg(function, context);
}

Table TableGroupBy::agg(AggregateFunction function, ExecutionContext &context) const
{
    return aggregateTable(table_, partition_, function, context);
}

Table TableGroupBy::agg(const AggregationSpec &spec) const
{
    ExecutionContext context;
    return agg(spec, context);
}

Table TableGroupBy::agg(const AggregationSpec &spec, ExecutionContext &context) const
{
    return aggregateTable(table_, partition_, spec, context);
}
