#pragma once

#include <cmath>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include "Column.h"
#include "Table.h"
#include "Execution/ExecutionContext.h"

struct DataGenerator
{
    std::mt19937 generator{ std::random_device{}() };

    template<typename Distribution>
    Column generateColumn(DType id, int64_t N, std::string name, double nullShare, Distribution distribution)
    {
        std::bernoulli_distribution nullDistribution{ nullShare };
        std::vector<Value> values;
        values.reserve(N);
        for(int64_t i = 0; i < N; i++)
        {
            if(nullDistribution(generator))
            {
                values.emplace_back(std::nullopt);
                continue;
            }

            const auto value = distribution(generator);
            switch(id)
            {
            case DType::Int32:   values.emplace_back((int32_t)value); break;
            case DType::Float64: values.emplace_back((double)value); break;
            case DType::String:  values.emplace_back(std::to_string((int64_t)value)); break;
            case DType::Bool:    values.emplace_back(((int64_t)value % 2) != 0); break;
            case DType::DateTime: values.emplace_back(Timestamp{(int64_t)value * 1'000'000'000}); break;
            }
        }

        ColumnOptions options;
        options.name = std::move(name);
        options.dtype = id;
        return Column(std::move(values), std::move(options));
    }

    Column generateColumn(DType id, int64_t N, std::string name, double nullShare = 0.0);
    Table generateNumericTable(int64_t N);
};

// Two engines over the same data: one portable, one with the accelerated library linked in.
struct BackendFixture
{
    std::shared_ptr<AcceleratedBackend> backend;
    ExecutionContext portable;
    ExecutionContext accelerated;

    BackendFixture();
    ~BackendFixture();
};

// Close enough for values computed along different summation orders. NaN equals NaN.
inline bool sameDouble(double lhs, double rhs, double tolerance = 1e-9)
{
    if(std::isnan(lhs) || std::isnan(rhs))
        return std::isnan(lhs) && std::isnan(rhs);
    return std::abs(lhs - rhs) <= tolerance * std::max({1.0, std::abs(lhs), std::abs(rhs)});
}

// Column equality with NaN == NaN and numeric tolerance, comparing name, dtype, index and values.
void checkSameColumn(const Column &lhs, const Column &rhs);

template<typename T>
std::vector<T> valuesOf(const Column &column)
{
    constexpr DType id = dtypeOf<T>;
    std::vector<T> ret;
    iterateOver<id>(column, [&] (const T &value) { ret.push_back(value); }, [] {});
    return ret;
}

std::vector<std::string> indexStrings(const Column &column);

// each argument is evaluated once, so temporaries are fine
#define BOOST_CHECK_EQUAL_RANGES(a, b) do {                 \
    const auto &lhsRange_ = (a);                            \
    const auto &rhsRange_ = (b);                            \
    BOOST_CHECK_EQUAL_COLLECTIONS(std::begin(lhsRange_), std::end(lhsRange_), std::begin(rhsRange_), std::end(rhsRange_)); \
} while(0)
