#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Core/Common.h"
#include "Column.h"
#include "Table.h"

class ExecutionContext;

// Keeps rows where mask is true. Mask length must match, otherwise UsageError.
TABULA_EXPORT Column filter(const Column &column, const Mask &mask, ExecutionContext &context);
TABULA_EXPORT Table filter(const Table &table, const Mask &mask, ExecutionContext &context);

// Bool column telling whether each element equals any candidate.
// Numeric columns compare numerically within the context's isin tolerance, other dtypes exactly.
TABULA_EXPORT Column isin(const Column &column, const std::vector<Value> &candidates, ExecutionContext &context);

TABULA_EXPORT Column isNull(const Column &column);
TABULA_EXPORT Column notNull(const Column &column);
TABULA_EXPORT Column dropNA(const Column &column);
TABULA_EXPORT Table dropNA(const Table &table);
TABULA_EXPORT Column fillNA(const Column &column, const Value &value);

TABULA_EXPORT Column uniqueValues(const Column &column);
TABULA_EXPORT int64_t countUnique(const Column &column);
// Counts of each non-null value, most frequent first. Indexed by the values' key strings.
TABULA_EXPORT Column countValues(const Column &column);

// Bin count (equal-width over the values' range) or explicit ascending edges.
using Bins = std::variant<int32_t, std::vector<double>>;

// Assigns each numeric value to a bin, giving label or "[a, b]" / "(a, b]" text. Values outside bins become null.
TABULA_EXPORT Column cut(const Column &column, const Bins &bins, const std::optional<std::vector<std::string>> &labels = std::nullopt);
