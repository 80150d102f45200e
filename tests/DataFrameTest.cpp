#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "dataframe/DataFrame.hpp"

using namespace dataframe;

TEST_CASE("DataFrame empty", "[DataFrame]") {
    DataFrame df;

    REQUIRE(df.rowCount() == 0);
    REQUIRE(df.columnCount() == 0);
    REQUIRE(df.empty());
    REQUIRE(df.getColumnNames().empty());
}

TEST_CASE("DataFrame typed columns", "[DataFrame]") {
    DataFrame df;

    df.addIntColumn("age");
    df.addDoubleColumn("salary");
    df.addStringColumn("name");

    REQUIRE(df.columnCount() == 3);
    REQUIRE(df.getColumn("age")->getType() == ColumnType::INT);
    REQUIRE(df.getColumn("salary")->getType() == ColumnType::DOUBLE);
    REQUIRE(df.getColumn("name")->getType() == ColumnType::STRING);
    REQUIRE(df.getColumnNames() == std::vector<std::string>{"age", "salary", "name"});
}

TEST_CASE("DataFrame addColumn with IColumnPtr", "[DataFrame]") {
    DataFrame df;

    auto intCol = std::make_shared<IntColumn>("custom_int");
    intCol->push_back(42);
    df.addColumn(intCol);

    REQUIRE(df.hasColumn("custom_int"));
    REQUIRE(df.rowCount() == 1);
}

TEST_CASE("DataFrame addColumn rejects invalid columns", "[DataFrame]") {
    DataFrame df;
    auto a = std::make_shared<IntColumn>("a");
    a->push_back(1);
    a->push_back(2);
    df.addColumn(a);

    SECTION("null column") {
        REQUIRE_THROWS_AS(df.addColumn(nullptr), std::invalid_argument);
    }

    SECTION("duplicate name") {
        auto dup = std::make_shared<IntColumn>("a");
        dup->push_back(1);
        dup->push_back(2);
        REQUIRE_THROWS_AS(df.addColumn(dup), std::invalid_argument);
    }

    SECTION("length mismatch") {
        auto shortCol = std::make_shared<IntColumn>("b");
        shortCol->push_back(1);
        REQUIRE_THROWS_AS(df.addColumn(shortCol), std::invalid_argument);
    }
}

TEST_CASE("DataFrame addRow", "[DataFrame]") {
    DataFrame df;
    df.addIntColumn("id");
    df.addStringColumn("name");
    df.addDoubleColumn("price");

    df.addRow({"1", "Apple", "1.50"});
    df.addRow({"2", "", "0.75"});

    REQUIRE(df.rowCount() == 2);
    REQUIRE_FALSE(df.empty());

    auto name = std::dynamic_pointer_cast<StringColumn>(df.getColumn("name"));
    REQUIRE(name->at(0) == "Apple");
    REQUIRE(name->isNull(1));

    auto price = std::dynamic_pointer_cast<DoubleColumn>(df.getColumn("price"));
    REQUIRE(price->at(1) == 0.75);

    REQUIRE_THROWS_AS(df.addRow({"3", "x"}), std::invalid_argument);
}

TEST_CASE("DataFrame column added later is padded with nulls", "[DataFrame]") {
    DataFrame df;
    df.addIntColumn("id");
    df.addRow({"1"});
    df.addRow({"2"});

    df.addStringColumn("note");

    auto note = df.getColumn("note");
    REQUIRE(note->size() == 2);
    REQUIRE(note->nullCount() == 2);
}

TEST_CASE("DataFrame getColumn on missing name", "[DataFrame]") {
    DataFrame df;
    df.addIntColumn("id");

    REQUIRE(df.getColumn("missing") == nullptr);
    REQUIRE_FALSE(df.hasColumn("missing"));
}

TEST_CASE("DataFrame toString", "[DataFrame]") {
    DataFrame df;
    df.addIntColumn("id");
    df.addStringColumn("name");
    for (int i = 0; i < 12; ++i) {
        df.addRow({std::to_string(i), i == 0 ? "" : "n"});
    }

    std::string text = df.toString(10);

    REQUIRE_THAT(text, Catch::Matchers::StartsWith("id\tname\t\n0\tnull\t\n"));
    REQUIRE_THAT(text, Catch::Matchers::EndsWith("... (2 more rows)\n"));
    REQUIRE(DataFrame().toString() == "Empty DataFrame\n");
}
