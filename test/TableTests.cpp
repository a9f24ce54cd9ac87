#include <boost/test/unit_test.hpp>

#include "Table.h"

#include "Fixture.h"

using namespace std::literals;

namespace
{
    Table peopleTable()
    {
        auto name = Column::fromVector("name", std::vector<std::string>{ "ann", "bob", "cid", "dan" });
        auto age = Column::fromVector("age", std::vector<std::optional<int32_t>>{ 31, std::nullopt, 25, 31 });
        auto score = Column::fromVector("score", std::vector<double>{ 1.5, 2.5, 3.5, 0.5 });
        return Table({ name, age, score });
    }
}

BOOST_AUTO_TEST_SUITE(TableSuite)

BOOST_AUTO_TEST_CASE(Construct)
{
    auto table = peopleTable();
    BOOST_CHECK_EQUAL(table.rowCount(), 4);
    BOOST_CHECK_EQUAL(table.columnCount(), 3);
    BOOST_CHECK_EQUAL_RANGES(table.columnNames(), (std::vector<std::string>{ "name", "age", "score" }));
    BOOST_CHECK(table.hasColumn("age"));
    BOOST_CHECK(!table.hasColumn("height"));
    BOOST_CHECK_EQUAL(table.column(2).name(), "score");

    for(auto &column : table.columns())
        BOOST_CHECK_EQUAL(column.sharedIndex(), table.sharedIndex());
}

BOOST_AUTO_TEST_CASE(ConstructionErrors)
{
    auto a = Column::fromVector("a", std::vector<int32_t>{ 1, 2 });
    auto b = Column::fromVector("b", std::vector<int32_t>{ 1, 2, 3 });
    BOOST_CHECK_THROW(Table({ a, b }), ConstructionError);
    BOOST_CHECK_THROW(Table({ a, a }), ConstructionError);
}

BOOST_AUTO_TEST_CASE(EmptyTable)
{
    Table table;
    BOOST_CHECK_EQUAL(table.rowCount(), 0);
    BOOST_CHECK_EQUAL(table.columnCount(), 0);
}

BOOST_AUTO_TEST_CASE(ColumnLookup)
{
    auto table = peopleTable();
    BOOST_CHECK_EQUAL(table.column("age").dtype(), DType::Int32);
    BOOST_CHECK_THROW(table.column("height"), UsageError);
    BOOST_CHECK_THROW(table.column(3), UsageError);
}

BOOST_AUTO_TEST_CASE(Select)
{
    auto table = peopleTable();
    auto selected = table.select({ "score", "name" });
    BOOST_CHECK_EQUAL_RANGES(selected.columnNames(), (std::vector<std::string>{ "score", "name" }));
    BOOST_CHECK_EQUAL(selected.rowCount(), 4);
    BOOST_CHECK_THROW(table.select({ "nope" }), UsageError);
}

BOOST_AUTO_TEST_CASE(WithColumn)
{
    auto table = peopleTable();
    auto replaced = table.withColumn(Column::fromVector("score", std::vector<double>{ 0, 0, 0, 0 }));
    BOOST_CHECK_EQUAL(replaced.columnCount(), 3);
    BOOST_CHECK_EQUAL(replaced.column("score").sum(), 0);

    auto added = table.withColumn(Column::fromVector("flag", std::vector<bool>{ true, false, true, false }));
    BOOST_CHECK_EQUAL(added.columnCount(), 4);
    BOOST_CHECK_EQUAL(table.columnCount(), 3);
}

BOOST_AUTO_TEST_CASE(Filter)
{
    auto table = peopleTable();
    auto filtered = table.filter({ true, false, false, true });
    BOOST_CHECK_EQUAL(filtered.rowCount(), 2);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<std::string>(filtered.column("name")), (std::vector<std::string>{ "ann", "dan" }));
    BOOST_CHECK_EQUAL_RANGES(indexStrings(filtered.column("score")), (std::vector<std::string>{ "0", "3" }));
    BOOST_CHECK_THROW(table.filter({ true }), UsageError);
}

BOOST_AUTO_TEST_CASE(DropNA)
{
    auto table = peopleTable();
    auto dropped = table.dropna();
    BOOST_CHECK_EQUAL(dropped.rowCount(), 3);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<std::string>(dropped.column("name")), (std::vector<std::string>{ "ann", "cid", "dan" }));
}

BOOST_AUTO_TEST_CASE(SortByTwoColumns)
{
    auto table = peopleTable();
    auto sorted = table.sortValues({ "age", "score" }, { true, false });
    // nulls last, ties on age broken by descending score
    BOOST_CHECK_EQUAL_RANGES(valuesOf<std::string>(sorted.column("name")), (std::vector<std::string>{ "cid", "ann", "dan", "bob" }));

    auto nullsFirst = table.sortValues({ "age" }, { true }, false);
    BOOST_CHECK_EQUAL_RANGES(valuesOf<std::string>(nullsFirst.column("name")), (std::vector<std::string>{ "bob", "cid", "ann", "dan" }));
}

BOOST_AUTO_TEST_CASE(SortByThreeColumns)
{
    auto a = Column::fromVector("a", std::vector<int32_t>{ 1, 1, 1, 0 });
    auto b = Column::fromVector("b", std::vector<int32_t>{ 2, 1, 1, 5 });
    auto c = Column::fromVector("c", std::vector<std::string>{ "z", "y", "x", "w" });
    Table table({ a, b, c });

    auto sorted = table.sortValues({ "a", "b", "c" }, {});
    BOOST_CHECK_EQUAL_RANGES(valuesOf<std::string>(sorted.column("c")), (std::vector<std::string>{ "w", "x", "y", "z" }));
    BOOST_CHECK_EQUAL_RANGES(indexStrings(sorted.column("c")), (std::vector<std::string>{ "3", "2", "1", "0" }));

    BOOST_CHECK_THROW(table.sortValues({ "a", "b" }, { true }), UsageError);
    BOOST_CHECK_THROW(table.sortValues({ "nope" }, {}), UsageError);
}

BOOST_AUTO_TEST_SUITE_END()
