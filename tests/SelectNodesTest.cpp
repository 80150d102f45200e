#include <catch2/catch_test_macros.hpp>
#include "nodes/NodeExecutor.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/nodes/common/register.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/DataFrameIO.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace nodes;
using namespace dataframe;

namespace {

struct SelectGraph {
    NodeRegistry registry;
    NodeGraph graph;

    SelectGraph() { common::registerNodes(registry); }

    std::string add(const std::string& kind) {
        return graph.addNode(registry.require(kind));
    }

    NodeResult eval(const std::string& nodeId) {
        NodeExecutor executor(registry);
        return executor.evaluate(graph, nodeId);
    }
};

IColumnPtr makeIntSeries() {
    auto col = std::make_shared<IntColumn>("v");
    for (int64_t i = 0; i < 5; ++i) {
        col->push_back(i);
    }
    col->pushNull();
    return col;
}

std::shared_ptr<DataFrame> makeFrame() {
    return DataFrameIO::parseCSV("id,name,price\n1,apple,1.5\n2,pear,3.0\n3,plum,0.5\n");
}

} // anonymous namespace

TEST_CASE("simple_filter keeps values in the closed range", "[SelectNodes]") {
    SelectGraph g;
    auto filter = g.add("simple_filter");
    g.graph.setInputValue(filter, "df", Value(makeIntSeries()));
    g.graph.setInputValue(filter, "min", 1.0);
    g.graph.setInputValue(filter, "max", 3.0);

    auto result = g.eval(filter);
    REQUIRE_FALSE(result.hasError);

    auto series = result.value.getSeries();
    REQUIRE(series->getName() == "v");
    REQUIRE(series->getType() == ColumnType::INT);
    REQUIRE(series->size() == 3);
    auto ints = std::static_pointer_cast<IntColumn>(series);
    REQUIRE(ints->data() == std::vector<int64_t>{1, 2, 3});
    REQUIRE(series->nullCount() == 0);
}

TEST_CASE("simple_filter with an empty range", "[SelectNodes]") {
    SelectGraph g;
    auto filter = g.add("simple_filter");
    g.graph.setInputValue(filter, "df", Value(makeIntSeries()));
    g.graph.setInputValue(filter, "min", 3.0);
    g.graph.setInputValue(filter, "max", 1.0);

    auto result = g.eval(filter);
    REQUIRE_FALSE(result.hasError);
    REQUIRE(result.value.getSeries()->size() == 0);
}

TEST_CASE("simple_filter rejects a text series", "[SelectNodes]") {
    auto col = std::make_shared<StringColumn>("name");
    col->push_back("a");
    col->push_back("b");

    SelectGraph g;
    auto filter = g.add("simple_filter");
    g.graph.setInputValue(filter, "df", Value(IColumnPtr(col)));

    auto result = g.eval(filter);
    REQUIRE(result.hasError);
    REQUIRE(result.errorKind == ErrorKind::TypeMismatch);
    REQUIRE(result.failedNodeId == filter);
}

TEST_CASE("select_column returns a copy of the column", "[SelectNodes]") {
    auto df = makeFrame();

    SelectGraph g;
    auto select = g.add("select_column");
    g.graph.setInputValue(select, "df", Value(df));
    g.graph.setInputValue(select, "column", Value("price"));

    auto result = g.eval(select);
    REQUIRE_FALSE(result.hasError);

    auto series = result.value.getSeries();
    REQUIRE(series->getName() == "price");
    REQUIRE(series->getType() == ColumnType::DOUBLE);
    REQUIRE(series->size() == 3);
    REQUIRE(series != df->getColumn("price"));
    REQUIRE(series->numericAt(1) == 3.0);
}

TEST_CASE("select_column of a missing column is empty", "[SelectNodes]") {
    SelectGraph g;
    auto select = g.add("select_column");
    g.graph.setInputValue(select, "df", Value(makeFrame()));
    g.graph.setInputValue(select, "column", Value("nope"));

    auto result = g.eval(select);
    REQUIRE_FALSE(result.hasError);
    REQUIRE(result.value.getSeries()->getName() == "empty");
    REQUIRE(result.value.getSeries()->size() == 0);
}

TEST_CASE("load, select and filter chained", "[SelectNodes]") {
    std::string path = "/tmp/test_select_nodes_" + std::to_string(std::rand()) + ".csv";
    {
        std::ofstream file(path);
        file << "id,price\n1,10\n2,25\n3,\n4,40\n5,55\n";
    }

    SelectGraph g;
    auto load = g.add("load_csv");
    auto select = g.add("select_column");
    auto filter = g.add("simple_filter");
    g.graph.setInputValue(load, "path", Value(path));
    g.graph.setInputValue(select, "column", Value("price"));
    g.graph.setInputValue(filter, "min", 20.0);
    g.graph.setInputValue(filter, "max", 50.0);
    g.graph.connect(load, "out", select, "df");
    g.graph.connect(select, "out", filter, "df");

    auto result = g.eval(filter);
    REQUIRE_FALSE(result.hasError);
    REQUIRE(result.cachedOutputs == 3);

    auto ints = std::static_pointer_cast<IntColumn>(result.value.getSeries());
    REQUIRE(ints->data() == std::vector<int64_t>{25, 40});

    std::filesystem::remove(path);
}
