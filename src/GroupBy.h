#pragma once

#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "Column.h"
#include "Table.h"

enum class AggregateFunction : int8_t;

struct GroupOptions
{
    bool dropna = true; // rows with a null in any key component are dropped, otherwise they form the "null" group
    bool sort = true;   // groups ordered by key string, otherwise by first occurrence
};

// Groups a Column by its own index labels (or a Table by its index).
struct UseIndex {};

using RowKeyFunction = std::function<Value(int64_t row)>;

struct TABULA_EXPORT KeySpec
{
    std::variant<UseIndex, std::string, std::vector<std::string>, RowKeyFunction, std::vector<Value>> spec;

    KeySpec() : spec(UseIndex{}) {}
    KeySpec(UseIndex) : spec(UseIndex{}) {}
    KeySpec(std::string column) : spec(std::move(column)) {}
    KeySpec(const char *column) : spec(std::string(column)) {}
    KeySpec(std::vector<std::string> columns) : spec(std::move(columns)) {}
    template<typename F, typename = std::enable_if_t<std::is_invocable_r_v<Value, F, int64_t>>>
    KeySpec(F function) : spec(RowKeyFunction(std::move(function))) {}
    KeySpec(std::vector<Value> keys) : spec(std::move(keys)) {}
    KeySpec(const Column &keys) : spec(keys.values()) {}
};

// Row positions of each group. Group identity is the binary encoding of the key components,
// keys hold their display form: components joined with '|', nulls shown as "null".
struct TABULA_EXPORT GroupPartition
{
    std::vector<std::string> keys;              // [group] => key, in output order
    std::vector<std::vector<int64_t>> rows;     // [group] => ascending row positions
    std::vector<int32_t> groupIds;              // [row] => group, -1 when the row was dropped
    std::unordered_map<std::string, int32_t> lookup; // key => first group with that key

    int64_t groupCount() const { return (int64_t)keys.size(); }
    int64_t rowCount() const { return (int64_t)groupIds.size(); }

    std::optional<int32_t> find(const std::string &key) const;
    const std::vector<int64_t> &rowsOf(const std::string &key) const;
    std::map<std::string, std::vector<int64_t>> toMap() const;
    IndexPtr keyIndex() const;
};

TABULA_EXPORT std::string encodeGroupKey(const std::vector<Value> &components);

TABULA_EXPORT GroupPartition buildGroups(const Column &column, const KeySpec &keys, const GroupOptions &options = {});
TABULA_EXPORT GroupPartition buildGroups(const Table &table, const KeySpec &keys, const GroupOptions &options = {});

using AggregationSpec = std::vector<std::pair<std::string, std::vector<AggregateFunction>>>; // column => functions

class TABULA_EXPORT ColumnGroupBy
{
    Column column_;
    GroupPartition partition_;

public:
    ColumnGroupBy(Column column, GroupPartition partition);

    const Column &column() const { return column_; }
    const GroupPartition &partition() const { return partition_; }
    const std::vector<std::string> &keys() const { return partition_.keys; }
    int64_t groupCount() const { return partition_.groupCount(); }
    std::map<std::string, std::vector<int64_t>> groups() const { return partition_.toMap(); }

    Column getGroup(const std::string &key) const;
    Column size() const;

    Column agg(AggregateFunction function) const;
    Column agg(AggregateFunction function, ExecutionContext &context) const;
    Column agg(const std::string &function) const;
    Table agg(const std::vector<AggregateFunction> &functions) const;
    Table agg(const std::vector<AggregateFunction> &functions, ExecutionContext &context) const;

    Column sum() const;
    Column mean() const;
    Column count() const;
    Column min() const;
    Column max() const;
    Column stdDev() const;
    Column var() const;
    Column first() const;
    Column last() const;
};

class TABULA_EXPORT TableGroupBy
{
    Table table_;
    GroupPartition partition_;

public:
    TableGroupBy(Table table, GroupPartition partition);

    const Table &table() const { return table_; }
    const GroupPartition &partition() const { return partition_; }
    const std::vector<std::string> &keys() const { return partition_.keys; }
    int64_t groupCount() const { return partition_.groupCount(); }
    std::map<std::string, std::vector<int64_t>> groups() const { return partition_.toMap(); }

    Table getGroup(const std::string &key) const;
    Column size() const;
    ColumnGroupBy operator[](const std::string &column) const;

    // same function for every column, column names kept
    Table agg(AggregateFunction function) const;
    Table agg(AggregateFunction function, ExecutionContext &context) const;
    // result columns named "<column>_<function>"
    Table agg(const AggregationSpec &spec) const;
    Table agg(const AggregationSpec &spec, ExecutionContext &context) const;
};
