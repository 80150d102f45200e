#include <catch2/catch_test_macros.hpp>
#include "app/AppConfig.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace flowgraph::app;

TEST_CASE("AppConfig defaults", "[AppConfig]") {
    AppConfig config = AppConfig::fromArgs(std::vector<std::string>{"graph.json"});

    REQUIRE(config.graphPath == "graph.json");
    REQUIRE_FALSE(config.nodeId.has_value());
    REQUIRE(config.format == "json");
    REQUIRE(config.logLevel == LogLevel::INFO);
    REQUIRE(config.logFile.empty());
    REQUIRE(config.maxRows == 10);
    REQUIRE_FALSE(config.printEvents);
    REQUIRE_FALSE(config.listNodes);
    REQUIRE_FALSE(config.showHelp);
    REQUIRE(config.warnings.empty());
}

TEST_CASE("AppConfig parses parameter lines", "[AppConfig]") {
    std::istringstream input(
        "# comment\n"
        "\n"
        "  log_level = debug  \n"
        "format=table\n"
        "not a parameter\n"
        "max_rows=25\r\n");

    auto params = AppConfig::parseParams(input);

    REQUIRE(params.size() == 3);
    REQUIRE(params["log_level"] == "debug");
    REQUIRE(params["format"] == "table");
    REQUIRE(params["max_rows"] == "25");
}

TEST_CASE("AppConfig applies parameters", "[AppConfig]") {
    AppConfig config;

    SECTION("Recognized keys") {
        config.applyParams({{"log_level", "warn"}, {"format", "table"},
                            {"max_rows", "3"}, {"log_file", "/tmp/fg.log"}});
        REQUIRE(config.logLevel == LogLevel::WARN);
        REQUIRE(config.format == "table");
        REQUIRE(config.maxRows == 3);
        REQUIRE(config.logFile == "/tmp/fg.log");
    }

    SECTION("Unknown keys are ignored and recorded") {
        config.applyParams({{"colour", "blue"}});
        REQUIRE(config.format == "json");
        REQUIRE(config.warnings == std::vector<std::string>{"Ignoring unknown config key: colour"});
    }

    SECTION("Invalid format") {
        REQUIRE_THROWS_AS(config.applyParams({{"format", "xml"}}), std::invalid_argument);
    }

    SECTION("Invalid max_rows") {
        REQUIRE_THROWS_AS(config.applyParams({{"max_rows", "-1"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(config.applyParams({{"max_rows", ""}}), std::invalid_argument);
    }

    SECTION("Invalid log level") {
        REQUIRE_THROWS_AS(config.applyParams({{"log_level", "loud"}}), std::invalid_argument);
    }
}

TEST_CASE("AppConfig command line flags", "[AppConfig]") {
    AppConfig config = AppConfig::fromArgs(std::vector<std::string>{
        "-n", "node_3", "g.json", "--format", "table", "-l", "error",
        "--max-rows", "5", "--events", "--list-nodes"});

    REQUIRE(config.graphPath == "g.json");
    REQUIRE(config.nodeId == std::string("node_3"));
    REQUIRE(config.format == "table");
    REQUIRE(config.logLevel == LogLevel::ERROR);
    REQUIRE(config.maxRows == 5);
    REQUIRE(config.printEvents);
    REQUIRE(config.listNodes);
}

TEST_CASE("AppConfig command line errors", "[AppConfig]") {
    using Args = std::vector<std::string>;

    REQUIRE_THROWS_AS(AppConfig::fromArgs(Args{"--bogus"}), std::invalid_argument);
    REQUIRE_THROWS_AS(AppConfig::fromArgs(Args{"a.json", "b.json"}), std::invalid_argument);
    REQUIRE_THROWS_AS(AppConfig::fromArgs(Args{"g.json", "--node"}), std::invalid_argument);
    REQUIRE_THROWS_AS(AppConfig::fromArgs(Args{"g.json", "-f", "yaml"}), std::invalid_argument);
}

TEST_CASE("AppConfig help flag", "[AppConfig]") {
    AppConfig config = AppConfig::fromArgs(std::vector<std::string>{"--help"});
    REQUIRE(config.showHelp);
    REQUIRE(AppConfig::usage("flowgraph").find("--max-rows") != std::string::npos);
}

TEST_CASE("AppConfig config file", "[AppConfig]") {
    std::string path = "/tmp/flowgraph_appconfig_test.conf";
    {
        std::ofstream out(path);
        out << "format=table\nlog_level=debug\nmax_rows=50\nthreads=4\n";
    }

    SECTION("Values from the file") {
        AppConfig config = AppConfig::fromArgs(std::vector<std::string>{"g.json", "--config", path});
        REQUIRE(config.format == "table");
        REQUIRE(config.logLevel == LogLevel::DEBUG);
        REQUIRE(config.maxRows == 50);
        REQUIRE(config.warnings.size() == 1);
    }

    SECTION("Command line overrides the file") {
        AppConfig config = AppConfig::fromArgs(std::vector<std::string>{
            "g.json", "--config", "@" + path, "-f", "json"});
        REQUIRE(config.format == "json");
        REQUIRE(config.maxRows == 50);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(AppConfig::loadParamsFile("/tmp/flowgraph_missing.conf"), std::runtime_error);
    }

    std::remove(path.c_str());
}
