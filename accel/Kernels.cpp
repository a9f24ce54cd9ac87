#include "Kernels.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string_view>
#include <unordered_set>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics.hpp>

#include "Accelerated.h"
#include "ArrowUtilities.h"
#include "Core/Common.h"

namespace ba = boost::accumulators;

namespace
{

template<typename ArrayType>
std::optional<double> valueAt(const ArrayType &array, int64_t index)
{
    if(array.IsNull(index))
        return std::nullopt;

    const double value = array.Value(index);
    if(std::isnan(value))
        return std::nullopt;
    return value;
}

std::vector<std::optional<double>> toOptionalVector(const arrow::Array &array)
{
    return visitArray(array, [] (auto *typedArray)
    {
        std::vector<std::optional<double>> ret;
        ret.reserve(typedArray->length());
        for(int64_t i = 0; i < typedArray->length(); i++)
            ret.push_back(valueAt(*typedArray, i));
        return ret;
    });
}

struct Sum
{
    double accumulator = 0;
    static constexpr int32_t RequiredSampleCount = 0;
    void operator() (double elem) { accumulator += elem; }
    double get() const { return accumulator; }
};

struct Mean
{
    int64_t count = 0;
    double accumulator = 0;
    static constexpr int32_t RequiredSampleCount = 1;
    void operator() (double elem) { accumulator += elem; count++; }
    double get() const { return accumulator / (double)count; }
};

struct Count
{
    int64_t count = 0;
    static constexpr int32_t RequiredSampleCount = 0;
    void operator() (double) { count++; }
    double get() const { return (double)count; }
};

struct Minimum
{
    double accumulator = std::numeric_limits<double>::infinity();
    static constexpr int32_t RequiredSampleCount = 1;
    void operator() (double elem) { accumulator = std::min(accumulator, elem); }
    double get() const { return accumulator; }
};

struct Maximum
{
    double accumulator = -std::numeric_limits<double>::infinity();
    static constexpr int32_t RequiredSampleCount = 1;
    void operator() (double elem) { accumulator = std::max(accumulator, elem); }
    double get() const { return accumulator; }
};

// sample variance, accumulator keeps the population one
struct Variance
{
    ba::accumulator_set<double, ba::stats<ba::tag::count, ba::tag::variance(ba::immediate)>> accumulator;
    static constexpr int32_t RequiredSampleCount = 2;
    void operator() (double elem) { accumulator(elem); }
    double get() const
    {
        const auto n = (double)ba::count(accumulator);
        return ba::variance(accumulator) * n / (n - 1);
    }
};

struct StdDev : Variance
{
    double get() const { return std::sqrt(Variance::get()); }
};

template<typename Aggregator>
struct Tracked
{
    Aggregator aggregator;
    int64_t validCount = 0;

    void operator() (double elem)
    {
        aggregator(elem);
        validCount++;
    }
    double get() const
    {
        if(validCount < Aggregator::RequiredSampleCount)
            return std::numeric_limits<double>::quiet_NaN();
        return aggregator.get();
    }
};

template<typename F>
auto dispatchFunction(int32_t function, F &&f)
{
    switch(function)
    {
    case TABULA_SUM:   return f(Tracked<Sum>{});
    case TABULA_MEAN:  return f(Tracked<Mean>{});
    case TABULA_COUNT: return f(Tracked<Count>{});
    case TABULA_MIN:   return f(Tracked<Minimum>{});
    case TABULA_MAX:   return f(Tracked<Maximum>{});
    case TABULA_STD:   return f(Tracked<StdDev>{});
    case TABULA_VAR:   return f(Tracked<Variance>{});
    default: THROW("not supported aggregate function bit {}", function);
    }
}

constexpr int32_t AllFunctions = TABULA_SUM | TABULA_MEAN | TABULA_COUNT | TABULA_MIN | TABULA_MAX | TABULA_STD | TABULA_VAR;

template<typename Comparator>
std::vector<int64_t> stableOrder(int64_t length, Comparator &&comparator)
{
    auto indices = iotaVector<int64_t>(length);
    std::stable_sort(indices.begin(), indices.end(), comparator);
    return indices;
}

// -1, 0, 1 like strcmp, nulls placed according to nullsFirst regardless of direction
int compareElements(const std::optional<double> &lhs, const std::optional<double> &rhs, bool ascending, bool nullsFirst)
{
    if(lhs && rhs)
    {
        if(*lhs == *rhs)
            return 0;
        const auto less = *lhs < *rhs;
        return (less == ascending) ? -1 : 1;
    }
    if(!lhs && !rhs)
        return 0;
    if(lhs) // lhs < null
        return nullsFirst ? 1 : -1;
    return nullsFirst ? -1 : 1;
}

}

double reduceArray(const arrow::Array &array, int32_t function)
{
    const auto values = toOptionalVector(array);
    return dispatchFunction(function, [&] (auto aggregator)
    {
        for(auto &value : values)
            if(value)
                aggregator(*value);
        return aggregator.get();
    });
}

std::vector<std::shared_ptr<arrow::Array>> groupReduceArray(const arrow::Array &array, const int32_t *groupIds, int32_t groupCount, int32_t functionMask)
{
    if(groupCount < 0)
        THROW("negative group count {}", groupCount);
    if(functionMask & ~AllFunctions)
        THROW("function mask {} has unknown bits", functionMask);

    const auto values = toOptionalVector(array);
    for(auto i = 0_z; i < values.size(); i++)
        if(groupIds[i] < -1 || groupIds[i] >= groupCount)
            THROW("row {} has group id {} out of range for {} groups", i, groupIds[i], groupCount);

    std::vector<std::shared_ptr<arrow::Array>> ret;
    for(int32_t bit = 1; bit <= AllFunctions; bit <<= 1)
    {
        if(!(functionMask & bit))
            continue;

        auto results = dispatchFunction(bit, [&] (auto prototype)
        {
            std::vector<decltype(prototype)> groups(groupCount);
            for(auto i = 0_z; i < values.size(); i++)
                if(groupIds[i] >= 0 && values[i])
                    groups[groupIds[i]](*values[i]);

            return transformToVector(groups, [] (const auto &group) { return group.get(); });
        });
        ret.push_back(toArray<arrow::Type::DOUBLE>(results));
    }
    return ret;
}

std::vector<int64_t> sortIndicesOf(const arrow::Array &array, bool ascending, bool nullsFirst)
{
    const auto values = toOptionalVector(array);
    return stableOrder(array.length(), [&] (int64_t lhs, int64_t rhs)
    {
        return compareElements(values[lhs], values[rhs], ascending, nullsFirst) < 0;
    });
}

std::vector<int64_t> sortIndicesOf(const arrow::Array &first, const arrow::Array &second, bool firstAscending, bool secondAscending, bool nullsFirst)
{
    if(first.length() != second.length())
        THROW("sort keys have different lengths: {} and {}", first.length(), second.length());

    const auto firstValues = toOptionalVector(first);
    const auto secondValues = toOptionalVector(second);
    return stableOrder(first.length(), [&] (int64_t lhs, int64_t rhs)
    {
        if(auto c = compareElements(firstValues[lhs], firstValues[rhs], firstAscending, nullsFirst))
            return c < 0;
        return compareElements(secondValues[lhs], secondValues[rhs], secondAscending, nullsFirst) < 0;
    });
}

std::shared_ptr<arrow::Array> filterArray(const arrow::Array &array, const uint8_t *mask)
{
    return visitArray(array, [&] (auto *typedArray)
    {
        using ArrayType = std::remove_const_t<std::remove_pointer_t<decltype(typedArray)>>;
        using BuilderType = typename TypeDescription<ArrayType::TypeClass::type_id>::BuilderType;

        BuilderType builder;
        for(int64_t i = 0; i < typedArray->length(); i++)
        {
            if(!mask[i])
                continue;
            if(typedArray->IsNull(i))
                checkStatus(builder.AppendNull());
            else
                checkStatus(builder.Append(typedArray->Value(i)));
        }
        return finish(builder);
    });
}

void isinNumeric(const arrow::Array &array, const std::vector<double> &candidates, double tolerance, uint8_t *out)
{
    tolerance = effectiveIsinTolerance(tolerance);
    const auto values = toOptionalVector(array);
    for(auto i = 0_z; i < values.size(); i++)
    {
        out[i] = values[i] && std::any_of(candidates.begin(), candidates.end(), [&] (double candidate)
        {
            return std::abs(*values[i] - candidate) < tolerance;
        });
    }
}

void isinStrings(const arrow::StringArray &values, const arrow::StringArray &candidates, uint8_t *out)
{
    const auto view = [] (const arrow::StringArray &array, int64_t i)
    {
        int32_t length = 0;
        auto data = array.GetValue(i, &length);
        return std::string_view(reinterpret_cast<const char *>(data), length);
    };

    std::unordered_set<std::string_view> lookup;
    for(int64_t i = 0; i < candidates.length(); i++)
        if(!candidates.IsNull(i))
            lookup.insert(view(candidates, i));

    for(int64_t i = 0; i < values.length(); i++)
        out[i] = !values.IsNull(i) && lookup.count(view(values, i));
}
