#pragma once

#include "AppConfig.hpp"
#include "nodes/NodeExecutor.hpp"
#include "nodes/NodeRegistry.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace flowgraph {
namespace app {

/**
 * Human readable rendering of a value for the table format.
 * Series and frames are printed as tables of at most maxRows rows.
 */
std::string formatValue(const nodes::Value& value, size_t maxRows);

/**
 * {"node_id", "kind", "value"} or {"node_id", "kind", "error": {"kind", "message", "node_id"}}
 */
nlohmann::json resultToJson(const nodes::NodeResult& result, const std::string& kind);

/**
 * Print the node catalog, as JSON or as tab separated lines
 */
void listNodes(const nodes::NodeRegistry& registry, const std::string& format, std::ostream& out);

/**
 * Load config.graphPath, evaluate the requested nodes and print the results to `out`.
 * With config.printEvents, execution events go to `events` as JSON lines so
 * that `out` stays a single document.
 *
 * Returns the process exit status: 0 when every node succeeded, 1 otherwise.
 * Throws std::runtime_error (or a parse error) when the graph cannot be loaded.
 */
int runGraph(const AppConfig& config, const nodes::NodeRegistry& registry,
             std::ostream& out, std::ostream& events);

} // namespace app
} // namespace flowgraph
