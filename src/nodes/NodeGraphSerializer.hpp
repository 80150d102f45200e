#pragma once

#include "nodes/NodeGraph.hpp"
#include "nodes/NodeRegistry.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace nodes {

using json = nlohmann::json;

/**
 * Serialization/Deserialization for NodeGraph
 *
 * JSON format:
 * {
 *   "nodes": [
 *     {"id": "node_1", "type": "make_scalar",
 *      "inputs": {"value": {"type": "scalar", "value": 5.0}},
 *      "position": [10, 20]}
 *   ],
 *   "connections": [
 *     {"from": "node_1", "fromPort": "out", "to": "node_2", "toPort": "A"}
 *   ]
 * }
 *
 * Inputs missing from a node entry keep their template default.
 */
class NodeGraphSerializer {
public:
    // === Serialization ===

    static json toJson(const NodeGraph& graph);
    static std::string toString(const NodeGraph& graph, int indent = 2);

    // === Deserialization ===

    /**
     * Create a NodeGraph from JSON, instantiating kinds from the registry.
     * Throws UnknownKindError for an unregistered "type", std::invalid_argument
     * for bad inputs or connections, std::runtime_error for malformed entries.
     */
    static NodeGraph fromJson(const json& j, const NodeRegistry& registry = NodeRegistry::instance());
    static NodeGraph fromString(const std::string& str, const NodeRegistry& registry = NodeRegistry::instance());

    /**
     * Load a graph document from disk
     */
    static NodeGraph fromFile(const std::string& path, const NodeRegistry& registry = NodeRegistry::instance());

    // === Helpers (public for result serialization) ===

    /**
     * {"type": "scalar", "value": 1.5}, {"type": "vector", "value": [x, y]},
     * {"type": "series", "value": {"name", "dtype", "data"}},
     * {"type": "frame", "value": {"columns", "schema", "data"}}
     */
    static json valueToJson(const Value& v);
    static Value jsonToValue(const json& j);

private:
    static json nodeInstanceToJson(const NodeInstance& node);
    static json connectionToJson(const Connection& conn);
};

} // namespace nodes
