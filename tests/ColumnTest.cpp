#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>
#include "dataframe/Column.hpp"

using namespace dataframe;
using Catch::Matchers::Equals;

// =============================================================================
// IntColumn Tests
// =============================================================================

TEST_CASE("IntColumn push_back and at", "[IntColumn]") {
    IntColumn col("numbers");

    col.push_back(10);
    col.push_back(20);
    col.push_back(30);

    REQUIRE(col.size() == 3);
    REQUIRE(col.at(0) == 10);
    REQUIRE(col.at(1) == 20);
    REQUIRE(col.at(2) == 30);
}

TEST_CASE("IntColumn getName and getType", "[IntColumn]") {
    IntColumn col("my_column");

    REQUIRE(col.getName() == "my_column");
    REQUIRE(col.getType() == ColumnType::INT);
    REQUIRE(col.isNumeric());

    col.setName("renamed");
    REQUIRE(col.getName() == "renamed");
}

TEST_CASE("IntColumn nulls", "[IntColumn]") {
    IntColumn col("n");
    col.push_back(1);
    col.pushNull();
    col.push_back(3);

    REQUIRE(col.size() == 3);
    REQUIRE_FALSE(col.isNull(0));
    REQUIRE(col.isNull(1));
    REQUIRE(col.nullCount() == 1);
    REQUIRE(col.toString(1).empty());
    REQUIRE_FALSE(col.numericAt(1).has_value());
    REQUIRE(col.numericAt(2).value() == 3.0);
}

TEST_CASE("IntColumn clone", "[IntColumn]") {
    IntColumn col("numbers");
    col.push_back(1);
    col.pushNull();
    col.push_back(3);

    auto cloned = col.clone();

    REQUIRE(cloned->size() == 3);
    REQUIRE(cloned->getName() == "numbers");
    REQUIRE(cloned->isNull(1));

    // Clone is independent
    col.push_back(4);
    REQUIRE(cloned->size() == 3);
    auto* intCloned = dynamic_cast<IntColumn*>(cloned.get());
    REQUIRE(intCloned != nullptr);
    REQUIRE(intCloned->at(0) == 1);
}

TEST_CASE("IntColumn filterBetween is inclusive and skips nulls", "[IntColumn]") {
    IntColumn col("numbers");
    col.push_back(0);
    col.push_back(1);
    col.push_back(2);
    col.push_back(3);
    col.push_back(4);
    col.pushNull();

    REQUIRE_THAT(col.filterBetween(1.0, 3.0), Equals(std::vector<size_t>{1, 2, 3}));
    REQUIRE(col.filterBetween(5.0, 10.0).empty());
    REQUIRE(col.filterBetween(3.0, 1.0).empty());
}

TEST_CASE("IntColumn filterByIndices", "[IntColumn]") {
    IntColumn col("numbers");
    col.push_back(10);
    col.pushNull();
    col.push_back(30);

    auto filtered = col.filterByIndices({0, 1, 2});
    REQUIRE(filtered->size() == 3);
    REQUIRE(filtered->isNull(1));

    auto subset = std::dynamic_pointer_cast<IntColumn>(col.filterByIndices({2}));
    REQUIRE(subset->size() == 1);
    REQUIRE(subset->at(0) == 30);
    REQUIRE(subset->getName() == "numbers");
}

// =============================================================================
// DoubleColumn Tests
// =============================================================================

TEST_CASE("DoubleColumn push_back and at", "[DoubleColumn]") {
    DoubleColumn col("prices");

    col.push_back(1.5);
    col.push_back(std::optional<double>(2.5));
    col.push_back(std::optional<double>());

    REQUIRE(col.size() == 3);
    REQUIRE(col.at(0) == 1.5);
    REQUIRE(col.at(1) == 2.5);
    REQUIRE(col.isNull(2));
    REQUIRE(col.getType() == ColumnType::DOUBLE);
}

TEST_CASE("DoubleColumn toString", "[DoubleColumn]") {
    DoubleColumn col("v");
    col.push_back(1.5);
    col.push_back(2.0);
    col.pushNull();

    REQUIRE(col.toString(0) == "1.5");
    REQUIRE(col.toString(1) == "2");
    REQUIRE(col.toString(2).empty());
}

TEST_CASE("DoubleColumn filterBetween", "[DoubleColumn]") {
    DoubleColumn col("v");
    col.push_back(0.5);
    col.push_back(1.0);
    col.pushNull();
    col.push_back(2.5);
    col.push_back(3.0);
    col.push_back(3.01);

    REQUIRE_THAT(col.filterBetween(1.0, 3.0), Equals(std::vector<size_t>{1, 3, 4}));
}

// =============================================================================
// StringColumn Tests
// =============================================================================

TEST_CASE("StringColumn basics", "[StringColumn]") {
    StringColumn col("names");
    col.push_back("Alice");
    col.pushNull();
    col.push_back("Bob");

    REQUIRE(col.size() == 3);
    REQUIRE(col.at(0) == "Alice");
    REQUIRE(col.isNull(1));
    REQUIRE(col.toString(2) == "Bob");
    REQUIRE(col.getType() == ColumnType::STRING);
}

TEST_CASE("StringColumn is not numeric", "[StringColumn]") {
    StringColumn col("names");
    col.push_back("1");

    REQUIRE_FALSE(col.isNumeric());
    REQUIRE_FALSE(col.numericAt(0).has_value());
    REQUIRE(col.filterBetween(0.0, 10.0).empty());
}

TEST_CASE("columnTypeToString", "[Column]") {
    REQUIRE(columnTypeToString(ColumnType::INT) == "INT");
    REQUIRE(columnTypeToString(ColumnType::DOUBLE) == "DOUBLE");
    REQUIRE(columnTypeToString(ColumnType::STRING) == "STRING");
}
