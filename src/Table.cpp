#include "Table.h"

#include "GroupBy.h"
#include "Processing.h"
#include "Sort.h"
#include "Execution/ExecutionContext.h"

Table::Table()
    : index_(defaultIndex(0))
{
}

Table::Table(std::vector<Column> columns, IndexPtr index)
{
    if(!index)
        index = columns.empty() ? defaultIndex(0) : columns.front().sharedIndex();

    for(auto &column : columns)
    {
        if(column.length() != (int64_t)index->size())
            THROW_AS(ConstructionError, "length mismatch: column '{}' has {} rows, table has {}", column.name(), column.length(), index->size());

        if(!positions_.emplace(column.name(), columns_.size()).second)
            THROW_AS(ConstructionError, "duplicate column name '{}'", column.name());

        columns_.push_back(column.sharedIndex() == index ? column : column.withIndex(index));
    }

    index_ = std::move(index);
}

std::vector<std::string> Table::columnNames() const
{
    return transformToVector(columns_, [] (const Column &column) { return column.name(); });
}

bool Table::hasColumn(const std::string &name) const
{
    return positions_.count(name) != 0;
}

const Column &Table::column(const std::string &name) const
{
    if(auto itr = positions_.find(name); itr != positions_.end())
        return columns_[itr->second];

    THROW_AS(UsageError, "column '{}' not found", name);
}

const Column &Table::column(int64_t position) const
{
    validateIndex(columnCount(), position);
    return columns_[position];
}

Table Table::select(const std::vector<std::string> &names) const
{
    auto selected = transformToVector(names, [&] (const std::string &name) { return column(name); });
    return Table(std::move(selected), index_);
}

Table Table::withColumn(Column column) const
{
    auto columns = columns_;
    if(auto itr = positions_.find(column.name()); itr != positions_.end())
        columns[itr->second] = std::move(column);
    else
        columns.push_back(std::move(column));
    return Table(std::move(columns), index_);
}

Table Table::filter(const Mask &mask) const
{
    ExecutionContext context;
    return filter(mask, context);
}

Table Table::filter(const Mask &mask, ExecutionContext &context) const
{
    return ::filter(*this, mask, context);
}

Table Table::sortValues(const std::vector<std::string> &by, const std::vector<bool> &ascending, bool nullsLast) const
{
    ExecutionContext context;
    return sortValues(by, ascending, nullsLast, context);
}

Table Table::sortValues(const std::vector<std::string> &by, const std::vector<bool> &ascending, bool nullsLast, ExecutionContext &context) const
{
    if(!ascending.empty() && ascending.size() != by.size())
        THROW_AS(UsageError, "length mismatch: {} sort columns but {} ascending flags", by.size(), ascending.size());

    const auto nulls = nullsLast ? NullPosition::After : NullPosition::Before;
    std::vector<SortBy> sortBy;
    for(auto i = 0_z; i < by.size(); i++)
    {
        const auto order = ascending.empty() || ascending[i] ? SortOrder::Ascending : SortOrder::Descending;
        sortBy.emplace_back(column(by[i]), order, nulls);
    }

    return sortTable(*this, sortBy, context);
}

Table Table::dropna() const
{
    return dropNA(*this);
}

TableGroupBy Table::groupBy(const KeySpec &keys) const
{
    return groupBy(keys, GroupOptions{});
}

TableGroupBy Table::groupBy(const KeySpec &keys, const GroupOptions &options) const
{
    return TableGroupBy(*this, buildGroups(*this, keys, options));
}
