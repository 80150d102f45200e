#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "app/Commands.hpp"
#include "nodes/nodes/common/register.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace flowgraph::app;
using nlohmann::json;

namespace {

// Writes a graph document to /tmp and removes it afterwards
struct GraphFile {
    std::string path;

    explicit GraphFile(const std::string& content)
        : path("/tmp/flowgraph_commands_test.json") {
        std::ofstream out(path);
        out << content;
    }

    ~GraphFile() { std::remove(path.c_str()); }
};

const char* kSumGraph = R"({
    "nodes": [
        {"id": "node_1", "type": "make_scalar", "inputs": {"value": {"type": "scalar", "value": 5}}},
        {"id": "node_2", "type": "add_scalar", "inputs": {"B": {"type": "scalar", "value": 10}}}
    ],
    "connections": [{"from": "node_1", "fromPort": "out", "to": "node_2", "toPort": "A"}]
})";

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) result.push_back(line);
    }
    return result;
}

} // anonymous namespace

TEST_CASE("runGraph prints one JSON document", "[Commands]") {
    nodes::NodeRegistry registry;
    common::registerNodes(registry);
    GraphFile file(kSumGraph);

    AppConfig config;
    config.graphPath = file.path;

    std::ostringstream out, events;
    REQUIRE(runGraph(config, registry, out, events) == 0);

    auto results = json::parse(out.str());
    REQUIRE(results.size() == 2);
    REQUIRE(results[0]["node_id"] == "node_1");
    REQUIRE(results[1]["kind"] == "add_scalar");
    REQUIRE(results[1]["value"]["value"] == 15.0);
    REQUIRE(events.str().empty());
}

TEST_CASE("runGraph keeps events out of the results stream", "[Commands]") {
    nodes::NodeRegistry registry;
    common::registerNodes(registry);
    GraphFile file(kSumGraph);

    AppConfig config;
    config.graphPath = file.path;
    config.nodeId = "node_2";
    config.printEvents = true;

    std::ostringstream out, events;
    REQUIRE(runGraph(config, registry, out, events) == 0);

    auto results = json::parse(out.str());
    REQUIRE(results.size() == 1);
    REQUIRE(results[0]["value"]["value"] == 15.0);

    auto eventLines = lines(events.str());
    REQUIRE(eventLines.size() == 4);
    for (const auto& line : eventLines) {
        auto evt = json::parse(line);
        REQUIRE(evt.contains("status"));
    }
    REQUIRE(json::parse(eventLines.back())["node_id"] == "node_2");
    REQUIRE(json::parse(eventLines.back())["status"] == "completed");
}

TEST_CASE("runGraph reports failures", "[Commands]") {
    nodes::NodeRegistry registry;
    common::registerNodes(registry);
    GraphFile file(R"({
        "nodes": [
            {"id": "load", "type": "load_csv", "inputs": {"path": {"type": "text", "value": "/tmp/flowgraph_no_such.csv"}}},
            {"id": "count", "type": "count_rows"}
        ],
        "connections": [{"from": "load", "fromPort": "out", "to": "count", "toPort": "df"}]
    })");

    AppConfig config;
    config.graphPath = file.path;
    config.nodeId = "count";

    SECTION("JSON") {
        std::ostringstream out, events;
        REQUIRE(runGraph(config, registry, out, events) == 1);

        auto results = json::parse(out.str());
        REQUIRE(results[0]["error"]["kind"] == "FileReadFailure");
        REQUIRE(results[0]["error"]["node_id"] == "load");
    }

    SECTION("Table") {
        config.format = "table";
        std::ostringstream out, events;
        REQUIRE(runGraph(config, registry, out, events) == 1);
        REQUIRE_THAT(out.str(), Catch::Matchers::StartsWith("count (count_rows): Execution error: "));
        REQUIRE_THAT(out.str(), Catch::Matchers::ContainsSubstring("[at load]"));
    }
}

TEST_CASE("runGraph table format", "[Commands]") {
    nodes::NodeRegistry registry;
    common::registerNodes(registry);
    GraphFile file(kSumGraph);

    AppConfig config;
    config.graphPath = file.path;
    config.nodeId = "node_2";
    config.format = "table";

    std::ostringstream out, events;
    REQUIRE(runGraph(config, registry, out, events) == 0);
    REQUIRE(out.str() == "node_2 (add_scalar): The result is: 15\n");
}

TEST_CASE("runGraph missing graph file", "[Commands]") {
    nodes::NodeRegistry registry;
    AppConfig config;
    config.graphPath = "/tmp/flowgraph_no_such_graph.json";

    std::ostringstream out, events;
    REQUIRE_THROWS_AS(runGraph(config, registry, out, events), std::runtime_error);
}

TEST_CASE("formatValue", "[Commands]") {
    REQUIRE(formatValue(nodes::Value(2.5), 10) == "2.5");
    REQUIRE(formatValue(nodes::Value(nodes::Vec2{1.0, -2.0}), 10) == "(1, -2)");
    REQUIRE(formatValue(nodes::Value("hi"), 10) == "\"hi\"");
}

TEST_CASE("listNodes", "[Commands]") {
    nodes::NodeRegistry registry;
    common::registerNodes(registry);

    SECTION("JSON") {
        std::ostringstream out;
        listNodes(registry, "json", out);
        auto list = json::parse(out.str());
        REQUIRE(list.size() == 11);
        REQUIRE(list[1]["name"] == "make_vector");
        REQUIRE(list[1]["outputs"][0]["type"] == "vector");
    }

    SECTION("Text") {
        std::ostringstream out;
        listNodes(registry, "table", out);
        auto rows = lines(out.str());
        REQUIRE(rows.size() == 11);
        REQUIRE(rows[0] == "make_scalar\tNew scalar\tScalar");
    }
}
