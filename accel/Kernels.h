#pragma once

#include <memory>
#include <vector>

#include <arrow/array.h>

// Numeric kernels over arrays held by the arena. Int32 and float64 arrays are accepted,
// NaN and arrow nulls both count as missing values.

// function is a single TABULA_* bit
double reduceArray(const arrow::Array &array, int32_t function);

// one float64 array of groupCount values per set bit of functionMask, in increasing bit order
std::vector<std::shared_ptr<arrow::Array>> groupReduceArray(const arrow::Array &array, const int32_t *groupIds, int32_t groupCount, int32_t functionMask);

std::vector<int64_t> sortIndicesOf(const arrow::Array &array, bool ascending, bool nullsFirst);
std::vector<int64_t> sortIndicesOf(const arrow::Array &first, const arrow::Array &second, bool firstAscending, bool secondAscending, bool nullsFirst);

std::shared_ptr<arrow::Array> filterArray(const arrow::Array &array, const uint8_t *mask);

void isinNumeric(const arrow::Array &array, const std::vector<double> &candidates, double tolerance, uint8_t *out);
void isinStrings(const arrow::StringArray &values, const arrow::StringArray &candidates, uint8_t *out);
