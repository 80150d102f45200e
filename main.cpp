#include "app/AppConfig.hpp"
#include "app/Commands.hpp"
#include "app/Logger.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/nodes/common/register.hpp"
#include <iostream>

using namespace flowgraph::app;

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = AppConfig::fromArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << AppConfig::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << AppConfig::usage(argv[0]);
        return 0;
    }

    // Configure Logger
    Logger::instance().setLevel(config.logLevel);
    if (!config.logFile.empty() && !Logger::instance().enableFileLogging(config.logFile)) {
        std::cerr << "Error: Cannot open log file: " << config.logFile << std::endl;
        return 1;
    }
    for (const auto& warning : config.warnings) {
        LOG_WARN(warning);
    }

    auto& registry = nodes::NodeRegistry::instance();
    common::registerNodes(registry);
    LOG_DEBUG("Registered " + std::to_string(registry.size()) + " node kinds");

    if (config.listNodes) {
        listNodes(registry, config.format, std::cout);
        return 0;
    }

    if (config.graphPath.empty()) {
        std::cerr << "Error: No graph file given\n\n" << AppConfig::usage(argv[0]);
        return 1;
    }

    try {
        // Events go to stderr so stdout holds only the results
        return runGraph(config, registry, std::cout, std::cerr);
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
