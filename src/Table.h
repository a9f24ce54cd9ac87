#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "Column.h"

class TableGroupBy;
struct SortBy;

// Ordered set of equal-length columns sharing one index.
class TABULA_EXPORT Table
{
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> positions_;
    IndexPtr index_;

public:
    Table();

    // Columns are re-indexed with the given index, or with the first column's index when none is given.
    explicit Table(std::vector<Column> columns, IndexPtr index = nullptr);

    int64_t rowCount() const { return (int64_t)index_->size(); }
    int64_t columnCount() const { return (int64_t)columns_.size(); }
    const Index &index() const { return *index_; }
    const IndexPtr &sharedIndex() const { return index_; }
    const std::vector<Column> &columns() const { return columns_; }
    std::vector<std::string> columnNames() const;

    bool hasColumn(const std::string &name) const;
    const Column &column(const std::string &name) const;
    const Column &column(int64_t position) const;

    Table select(const std::vector<std::string> &names) const;
    Table withColumn(Column column) const;

    Table filter(const Mask &mask) const;
    Table filter(const Mask &mask, ExecutionContext &context) const;

    Table sortValues(const std::vector<std::string> &by, const std::vector<bool> &ascending, bool nullsLast = true) const;
    Table sortValues(const std::vector<std::string> &by, const std::vector<bool> &ascending, bool nullsLast, ExecutionContext &context) const;

    // drops every row having a null in any column
    Table dropna() const;

    TableGroupBy groupBy(const KeySpec &keys) const;
    TableGroupBy groupBy(const KeySpec &keys, const GroupOptions &options) const;
};
