#include <boost/test/unit_test.hpp>

#include "ArrowUtilities.h"
#include "HandleArena.h"

BOOST_AUTO_TEST_SUITE(HandleArenaSuite)

BOOST_AUTO_TEST_CASE(AddAllRegistersEveryArray)
{
    HandleArena arena;
    auto handles = arena.addAll({ toArray<arrow::Type::DOUBLE>({ 1.0, 2.0 }), toArray<arrow::Type::INT32>({ 3 }) });
    BOOST_REQUIRE_EQUAL(handles.size(), 2);
    BOOST_CHECK_NE(handles[0], handles[1]);
    BOOST_CHECK_EQUAL(arena.handleCount(), 2);
    BOOST_CHECK_EQUAL(arena.access(handles[0])->length(), 2);
    BOOST_CHECK_GE(arena.bytesAllocated(), 2 * 8 + 4);
}

BOOST_AUTO_TEST_CASE(FailedAddAllLeavesNoHandles)
{
    HandleArena arena;
    const auto kept = arena.add(toArray<arrow::Type::INT32>({ 1, 2, 3 }));
    const auto keptBytes = arena.bytesAllocated();

    std::vector<std::shared_ptr<arrow::Array>> arrays{ toArray<arrow::Type::DOUBLE>({ 1.0 }), toArray<arrow::Type::DOUBLE>({ 2.0 }), nullptr };
    BOOST_CHECK_THROW(arena.addAll(std::move(arrays)), std::runtime_error);

    BOOST_CHECK_EQUAL(arena.handleCount(), 1);
    BOOST_CHECK_EQUAL(arena.bytesAllocated(), keptBytes);
    BOOST_CHECK_EQUAL(arena.access(kept)->length(), 3);

    // ids consumed by the rolled back adds are not handed out again
    BOOST_CHECK_GT(arena.add(toArray<arrow::Type::INT32>({ 4 })), kept + 2);
}

BOOST_AUTO_TEST_SUITE_END()
