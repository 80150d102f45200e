#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "app/Logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace flowgraph::app;

namespace {

// Routes the singleton to a buffer for the duration of a test
struct CapturedLog {
    std::ostringstream buffer;
    LogLevel previous;

    CapturedLog() : previous(Logger::instance().getLevel()) {
        Logger::instance().setOutputStream(&buffer);
    }

    ~CapturedLog() {
        Logger::instance().setOutputStream(nullptr);
        Logger::instance().setLevel(previous);
    }
};

} // anonymous namespace

TEST_CASE("Logger line format", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::INFO);

    LOG_INFO("graph loaded");

    std::string line = log.buffer.str();
    REQUIRE(line.front() == '[');
    REQUIRE_THAT(line, Catch::Matchers::ContainsSubstring("] [INFO ] graph loaded"));
    REQUIRE(line.back() == '\n');
}

TEST_CASE("Logger filters below the level", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    LOG_WARN("shown warn");
    LOG_ERROR("shown error");

    std::string out = log.buffer.str();
    REQUIRE(out.find("hidden") == std::string::npos);
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("[WARN ] shown warn"));
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("[ERROR] shown error"));
}

TEST_CASE("Logger parses level names", "[Logger]") {
    REQUIRE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("info") == LogLevel::INFO);
    REQUIRE(Logger::parseLevel("warn") == LogLevel::WARN);
    REQUIRE(Logger::parseLevel("error") == LogLevel::ERROR);
    REQUIRE_THROWS_AS(Logger::parseLevel("INFO"), std::invalid_argument);
    REQUIRE(Logger::levelToString(LogLevel::DEBUG) == "DEBUG");
}

TEST_CASE("Logger file sink", "[Logger]") {
    CapturedLog log;
    Logger::instance().setLevel(LogLevel::INFO);

    SECTION("Appends to the file") {
        std::string path = "/tmp/flowgraph_logger_test.log";
        std::remove(path.c_str());

        REQUIRE(Logger::instance().enableFileLogging(path));
        LOG_INFO("to file");
        Logger::instance().setOutputStream(&log.buffer);

        std::ifstream in(path);
        std::stringstream content;
        content << in.rdbuf();
        REQUIRE_THAT(content.str(), Catch::Matchers::ContainsSubstring("to file"));
        REQUIRE(log.buffer.str().empty());

        std::remove(path.c_str());
    }

    SECTION("Unopenable path") {
        REQUIRE_FALSE(Logger::instance().enableFileLogging("/nonexistent_dir/flowgraph.log"));
        LOG_INFO("still buffered");
        REQUIRE_THAT(log.buffer.str(), Catch::Matchers::ContainsSubstring("still buffered"));
    }
}
