#if !defined(_MSC_VER) && !defined(BOOST_TEST_DYN_LINK)
#define BOOST_TEST_DYN_LINK  // otherwise GCC gets undefined main error
#endif

#define BOOST_TEST_MODULE TabulaTests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>

#include <date/date.h>

#include "Core/DType.h"
#include "Core/Timestamp.h"
#include "Core/Value.h"

#include "Fixture.h"

using namespace std::literals;
using namespace date::literals;

BOOST_AUTO_TEST_CASE(DTypeFromName)
{
    BOOST_CHECK_EQUAL(dtypeFromName("int32"), DType::Int32);
    BOOST_CHECK_EQUAL(dtypeFromName("Float64"), DType::Float64);
    BOOST_CHECK_EQUAL(dtypeFromName("string"), DType::String);
    BOOST_CHECK_EQUAL(dtypeFromName("BOOL"), DType::Bool);
    BOOST_CHECK_EQUAL(dtypeFromName("datetime"), DType::DateTime);

    // unknown names are permissive
    BOOST_CHECK_EQUAL(dtypeFromName("complex128"), DType::String);
    BOOST_CHECK_EQUAL(dtypeFromName(""), DType::String);

    BOOST_CHECK(isNumeric(DType::Int32));
    BOOST_CHECK(isNumeric(DType::Float64));
    BOOST_CHECK(!isNumeric(DType::String));
    BOOST_CHECK(!isNumeric(DType::Bool));
    BOOST_CHECK(!isNumeric(DType::DateTime));
}

BOOST_AUTO_TEST_CASE(ValueNullness)
{
    BOOST_CHECK(isNull(Value{std::nullopt}));
    BOOST_CHECK(isNull(Value{std::numeric_limits<double>::quiet_NaN()}));
    BOOST_CHECK(!isNull(Value{0.0}));
    BOOST_CHECK(!isNull(Value{""s}));
    BOOST_CHECK(!isNull(Value{false}));
}

BOOST_AUTO_TEST_CASE(ValueKeyStrings)
{
    BOOST_CHECK_EQUAL(toKeyString(Value{std::nullopt}), "null");
    BOOST_CHECK_EQUAL(toKeyString(Value{std::numeric_limits<double>::quiet_NaN()}), "null");
    BOOST_CHECK_EQUAL(toKeyString(Value{int32_t{42}}), "42");
    BOOST_CHECK_EQUAL(toKeyString(Value{2.5}), "2.5");
    BOOST_CHECK_EQUAL(toKeyString(Value{"abc"s}), "abc");
    BOOST_CHECK_EQUAL(toKeyString(Value{true}), "true");
    BOOST_CHECK_EQUAL(toKeyString(Value{Timestamp{2018_y/10/12}}), "2018-10-12");
    BOOST_CHECK_EQUAL(formatDouble(std::numeric_limits<double>::quiet_NaN()), "NaN");
}

BOOST_AUTO_TEST_CASE(ValueConversions)
{
    BOOST_CHECK_EQUAL(convertValue<DType::Int32>(Value{"17"s}).value(), 17);
    BOOST_CHECK(!convertValue<DType::Int32>(Value{"17x"s}));
    BOOST_CHECK(!convertValue<DType::Int32>(Value{""s}));
    BOOST_CHECK_EQUAL(convertValue<DType::Float64>(Value{"2.25"s}).value(), 2.25);
    BOOST_CHECK_EQUAL(convertValue<DType::Float64>(Value{int32_t{3}}).value(), 3.0);
    BOOST_CHECK_EQUAL(convertValue<DType::Bool>(Value{"TRUE"s}).value(), true);
    BOOST_CHECK(!convertValue<DType::Bool>(Value{"yes please"s}));
    BOOST_CHECK_EQUAL(convertValue<DType::String>(Value{int32_t{5}}).value(), "5");
    BOOST_CHECK(!convertValue<DType::DateTime>(Value{int32_t{5}}));
}

BOOST_AUTO_TEST_CASE(ParseTimestamp)
{
    auto day = parseTimestamp("2018-10-12");
    BOOST_REQUIRE(day);
    BOOST_CHECK(day->ymd() == 2018_y/10/12);
    BOOST_CHECK_EQUAL(std::to_string(*day), "2018-10-12");

    auto withTime = parseTimestamp("2018-10-12 13:45:00");
    BOOST_REQUIRE(withTime);
    BOOST_CHECK(withTime->ymd() == 2018_y/10/12);
    BOOST_CHECK_EQUAL(withTime->toStorage() - day->toStorage(), (13 * 3600 + 45 * 60) * 1'000'000'000LL);

    BOOST_CHECK(!parseTimestamp("12/10/2018"));
    BOOST_CHECK(!parseTimestamp(""));
}
