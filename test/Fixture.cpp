#include "Fixture.h"

#include <boost/test/unit_test.hpp>

#include "Execution/LinkedBackend.h"

Column DataGenerator::generateColumn(DType id, int64_t N, std::string name, double nullShare)
{
    switch(id)
    {
    case DType::Float64:
        return generateColumn(id, N, std::move(name), nullShare, std::uniform_real_distribution<double>{-1000, 1000});
    case DType::String:
    case DType::Bool:
        return generateColumn(id, N, std::move(name), nullShare, std::uniform_int_distribution<int64_t>{0, 50});
    default:
        return generateColumn(id, N, std::move(name), nullShare, std::uniform_int_distribution<int64_t>{-1000, 1000});
    }
}

Table DataGenerator::generateNumericTable(int64_t N)
{
    auto keys = generateColumn(DType::Int32, N, "key", 0.0, std::uniform_int_distribution<int64_t>{0, 20});
    auto ints = generateColumn(DType::Int32, N, "ints");
    auto doubles = generateColumn(DType::Float64, N, "doubles", 0.1);
    return Table({ keys, ints, doubles });
}

BackendFixture::BackendFixture()
    : backend(makeLinkedBackend())
    , accelerated(EngineConfig{}, backend)
{
}

BackendFixture::~BackendFixture()
{
    BOOST_CHECK_EQUAL(backend->liveHandleCount(), 0);
}

void checkSameColumn(const Column &lhs, const Column &rhs)
{
    BOOST_CHECK_EQUAL(lhs.name(), rhs.name());
    BOOST_CHECK_EQUAL(lhs.dtype(), rhs.dtype());
    BOOST_REQUIRE_EQUAL(lhs.length(), rhs.length());
    BOOST_CHECK(lhs.index() == rhs.index());

    for(int64_t row = 0; row < lhs.length(); row++)
    {
        const auto l = lhs.at(row);
        const auto r = rhs.at(row);
        auto ld = std::get_if<double>(&l);
        auto rd = std::get_if<double>(&r);
        if(ld && rd)
            BOOST_CHECK_MESSAGE(sameDouble(*ld, *rd), "row " << row << ": " << *ld << " != " << *rd);
        else
            BOOST_CHECK_MESSAGE(toKeyString(l) == toKeyString(r), "row " << row << ": " << l << " != " << r);
    }
}

std::vector<std::string> indexStrings(const Column &column)
{
    return transformToVector(column.index(), [] (const Label &label) { return to_string(label); });
}
