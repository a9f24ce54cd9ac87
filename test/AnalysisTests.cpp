#include <boost/test/unit_test.hpp>

#include <cmath>

#include "Analysis.h"
#include "GroupBy.h"

#include "Fixture.h"

using namespace std::literals;

namespace
{
    const std::vector<AggregateFunction> numericFunctions = {
        AggregateFunction::Sum, AggregateFunction::Mean, AggregateFunction::Count, AggregateFunction::Minimum,
        AggregateFunction::Maximum, AggregateFunction::StdDev, AggregateFunction::Variance
    };
}

BOOST_AUTO_TEST_SUITE(AnalysisSuite)

BOOST_AUTO_TEST_CASE(FunctionNames)
{
    BOOST_CHECK_EQUAL(aggregateFunctionFromName("sum"), AggregateFunction::Sum);
    BOOST_CHECK_EQUAL(aggregateFunctionFromName("std"), AggregateFunction::StdDev);
    BOOST_CHECK_EQUAL(aggregateFunctionFromName("size"), AggregateFunction::Size);
    BOOST_CHECK_THROW(aggregateFunctionFromName("median"), UsageError);
    BOOST_CHECK_THROW(aggregateFunctionFromName("SUM"), UsageError);

    BOOST_CHECK(isNumericReduction(AggregateFunction::Variance));
    BOOST_CHECK(!isNumericReduction(AggregateFunction::First));
}

BOOST_AUTO_TEST_CASE(ScalarStats)
{
    ExecutionContext context;
    auto column = Column::fromVector("x", std::vector<std::optional<double>>{ 4, std::nullopt, 8, 6 });
    BOOST_CHECK_EQUAL(calculateStat(column, AggregateFunction::Sum, context), 18);
    BOOST_CHECK_EQUAL(calculateStat(column, AggregateFunction::Count, context), 3);
    BOOST_CHECK(sameDouble(calculateStat(column, AggregateFunction::Variance, context), 4));
    BOOST_CHECK_EQUAL(calculateStat(column, AggregateFunction::Size, context), 4);
    BOOST_CHECK_THROW(calculateStat(column, AggregateFunction::First, context), UsageError);
}

BOOST_AUTO_TEST_CASE(ReductionNamesAndTypes)
{
    auto values = Column::fromVector("v", std::vector<int32_t>{ 5, 1, 7, 3 });
    auto grouped = values.groupBy(std::vector<Value>{ "a"s, "b"s, "a"s, "b"s });

    auto count = grouped.count();
    BOOST_CHECK_EQUAL(count.name(), "v_count");
    BOOST_CHECK_EQUAL(count.dtype(), DType::Int32);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<int32_t>(count), (std::vector<int32_t>{ 2, 2 }));

    auto size = grouped.size();
    BOOST_CHECK_EQUAL(size.dtype(), DType::Int32);

    auto minimum = grouped.min();
    BOOST_CHECK_EQUAL(minimum.name(), "v_min");
    BOOST_CHECK_EQUAL(minimum.dtype(), DType::Float64);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(minimum), (std::vector<double>{ 5, 1 }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(grouped.max()), (std::vector<double>{ 7, 3 }));

    auto last = grouped.last();
    BOOST_CHECK_EQUAL(last.name(), "v_last");
    BOOST_CHECK_EQUAL(last.dtype(), DType::Int32);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<int32_t>(last), (std::vector<int32_t>{ 7, 3 }));
    BOOST_CHECK_EQUAL_RANGES(indexStrings(last), (std::vector<std::string>{ "a", "b" }));

    BOOST_CHECK_EQUAL(grouped.agg("mean").name(), "v_mean");
    BOOST_CHECK_THROW(grouped.agg("median"), UsageError);
}

BOOST_AUTO_TEST_CASE(SmallGroupsYieldNaN)
{
    auto values = Column::fromVector("v", std::vector<std::optional<double>>{ 1, std::nullopt, 2, 4 });
    auto grouped = values.groupBy(std::vector<Value>{ int32_t{0}, int32_t{1}, int32_t{2}, int32_t{2} });

    auto sums = grouped.sum().toOptionalVector<DType::Float64>();
    BOOST_CHECK(sums[1] == 0.0);

    auto means = grouped.mean().toOptionalVector<DType::Float64>();
    BOOST_CHECK(!means[1]);

    auto variances = grouped.var().toOptionalVector<DType::Float64>();
    BOOST_CHECK(!variances[0]);
    BOOST_CHECK(!variances[1]);
    BOOST_CHECK(sameDouble(*variances[2], 2.0));

    auto deviations = grouped.stdDev().toOptionalVector<DType::Float64>();
    BOOST_CHECK(sameDouble(*deviations[2], std::sqrt(2.0)));
}

BOOST_AUTO_TEST_CASE(MultiReduceMatchesSingleReductions)
{
    DataGenerator g;
    ExecutionContext context;
    for(auto dtype : { DType::Int32, DType::Float64 })
    {
        auto values = g.generateColumn(dtype, 500, "v", 0.1);
        auto keys = g.generateColumn(DType::Int32, 500, "k", 0.0, std::uniform_int_distribution<int64_t>{0, 12});
        auto partition = buildGroups(values, KeySpec{keys});

        auto all = multiReduce(values, partition, numericFunctions, context);
        BOOST_REQUIRE_EQUAL(all.size(), numericFunctions.size());
        for(auto i = 0_z; i < numericFunctions.size(); i++)
            checkSameColumn(all[i], reduce(values, partition, numericFunctions[i], context));

        // sum == count * mean in every group with values
        auto sums = all[0].toOptionalVector<DType::Float64>();
        auto means = all[1].toOptionalVector<DType::Float64>();
        auto counts = all[2].toOptionalVector<DType::Int32>();
        for(auto group = 0_z; group < sums.size(); group++)
        {
            if(*counts[group] == 0)
                continue;
            BOOST_CHECK(sameDouble(*sums[group], *counts[group] * *means[group]));
        }
    }
}

BOOST_AUTO_TEST_CASE(NonNumericReductions)
{
    auto names = Column::fromVector("name", std::vector<std::optional<std::string>>{ "ann"s, std::nullopt, "bob"s });
    auto grouped = names.groupBy(std::vector<Value>{ int32_t{1}, int32_t{1}, int32_t{2} });

    BOOST_CHECK_EQUAL_RANGES(valuesOf<int32_t>(grouped.count()), (std::vector<int32_t>{ 1, 1 }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(grouped.sum()), (std::vector<double>{ 0, 0 }));
    BOOST_CHECK_EQUAL(grouped.mean().nullCount(), 2);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<std::string>(grouped.first()), (std::vector<std::string>{ "ann", "bob" }));

    // last of a group may be a null
    auto last = grouped.last();
    BOOST_CHECK(last.isNull(0));
    BOOST_CHECK_EQUAL(last.dtype(), DType::String);
}

BOOST_AUTO_TEST_CASE(ColumnAggOfSeveralFunctions)
{
    auto values = Column::fromVector("v", std::vector<double>{ 1, 2, 3, 4 });
    auto grouped = values.groupBy(std::vector<Value>{ "x"s, "x"s, "y"s, "y"s });
    auto table = grouped.agg({ AggregateFunction::Sum, AggregateFunction::Size });

    BOOST_CHECK_EQUAL_RANGES(table.columnNames(), (std::vector<std::string>{ "v_sum", "v_size" }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(table.column("v_sum")), (std::vector<double>{ 3, 7 }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<int32_t>(table.column("v_size")), (std::vector<int32_t>{ 2, 2 }));
}

BOOST_AUTO_TEST_CASE(TableAggregation)
{
    auto dept = Column::fromVector("dept", std::vector<std::string>{ "eng", "ops", "eng" });
    auto salary = Column::fromVector("salary", std::vector<double>{ 10, 20, 30 });
    auto age = Column::fromVector("age", std::vector<int32_t>{ 30, 40, 50 });
    Table table({ dept, salary, age });
    auto grouped = table.groupBy("dept");

    // one function over every column keeps the names, key column included
    auto means = grouped.agg(AggregateFunction::Mean);
    BOOST_CHECK_EQUAL_RANGES(means.columnNames(), (std::vector<std::string>{ "dept", "salary", "age" }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(means.column("salary")), (std::vector<double>{ 20, 20 }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(means.column("age")), (std::vector<double>{ 40, 40 }));
    BOOST_CHECK_EQUAL(means.column("dept").nullCount(), 2);
    BOOST_CHECK_EQUAL_RANGES(indexStrings(means.column("age")), (std::vector<std::string>{ "eng", "ops" }));

    auto spec = grouped.agg(AggregationSpec{
        { "salary", { AggregateFunction::Sum, AggregateFunction::Maximum } },
        { "age", { AggregateFunction::Count } } });
    BOOST_CHECK_EQUAL_RANGES(spec.columnNames(), (std::vector<std::string>{ "salary_sum", "salary_max", "age_count" }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(spec.column("salary_sum")), (std::vector<double>{ 40, 20 }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(spec.column("salary_max")), (std::vector<double>{ 30, 20 }));
    BOOST_CHECK_EQUAL_RANGES(valuesOf<int32_t>(spec.column("age_count")), (std::vector<int32_t>{ 2, 1 }));

    BOOST_CHECK_THROW(grouped.agg(AggregationSpec{ { "bonus", { AggregateFunction::Sum } } }), UsageError);
    BOOST_CHECK_THROW(grouped.agg(AggregationSpec{ { "salary", {} } }), UsageError);

    auto salaries = grouped["salary"].sum();
    BOOST_CHECK_EQUAL(salaries.name(), "salary_sum");
    BOOST_CHECK_EQUAL_RANGES(valuesOf<double>(salaries), (std::vector<double>{ 40, 20 }));
}

BOOST_AUTO_TEST_SUITE_END()
