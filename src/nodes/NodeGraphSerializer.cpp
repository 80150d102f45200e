#include "nodes/NodeGraphSerializer.hpp"
#include "nodes/Errors.hpp"
#include "dataframe/DataFrameSerializer.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace nodes {

// =============================================================================
// Serialization
// =============================================================================

json NodeGraphSerializer::toJson(const NodeGraph& graph) {
    json result;

    json nodesArray = json::array();
    for (const auto& nodeId : graph.getNodeIds()) {
        nodesArray.push_back(nodeInstanceToJson(*graph.getNode(nodeId)));
    }
    result["nodes"] = nodesArray;

    json connectionsArray = json::array();
    for (const auto& conn : graph.getConnections()) {
        connectionsArray.push_back(connectionToJson(conn));
    }
    result["connections"] = connectionsArray;

    return result;
}

std::string NodeGraphSerializer::toString(const NodeGraph& graph, int indent) {
    return toJson(graph).dump(indent);
}

json NodeGraphSerializer::nodeInstanceToJson(const NodeInstance& node) {
    json j;
    j["id"] = node.id;
    j["type"] = node.kind;

    json inputs = json::object();
    for (const auto& port : node.inputs) {
        inputs[port.name] = valueToJson(port.value);
    }
    j["inputs"] = inputs;

    if (node.position) {
        j["position"] = json::array({node.position->first, node.position->second});
    }
    return j;
}

json NodeGraphSerializer::connectionToJson(const Connection& conn) {
    return {
        {"from", conn.sourceNodeId},
        {"fromPort", conn.sourcePortName},
        {"to", conn.targetNodeId},
        {"toPort", conn.targetPortName}
    };
}

// =============================================================================
// Deserialization
// =============================================================================

NodeGraph NodeGraphSerializer::fromJson(const json& j, const NodeRegistry& registry) {
    if (!j.is_object()) {
        throw std::runtime_error("Invalid graph document: expected an object");
    }

    NodeGraph graph;

    if (j.contains("nodes") && j["nodes"].is_array()) {
        for (const auto& nodeJson : j["nodes"]) {
            if (!nodeJson.contains("id") || !nodeJson.contains("type")) {
                throw std::runtime_error("Invalid node: missing 'id' or 'type'");
            }

            std::string id = nodeJson["id"].get<std::string>();
            std::string type = nodeJson["type"].get<std::string>();

            graph.addNodeWithId(id, registry.require(type));

            if (nodeJson.contains("inputs") && nodeJson["inputs"].is_object()) {
                for (const auto& [inputName, inputValue] : nodeJson["inputs"].items()) {
                    graph.setInputValue(id, inputName, jsonToValue(inputValue));
                }
            }

            // Position is optional
            if (nodeJson.contains("position") && nodeJson["position"].is_array() &&
                nodeJson["position"].size() >= 2) {
                graph.setPosition(id,
                                  nodeJson["position"][0].get<double>(),
                                  nodeJson["position"][1].get<double>());
            }
        }
    }

    if (j.contains("connections") && j["connections"].is_array()) {
        for (const auto& connJson : j["connections"]) {
            if (!connJson.contains("from") || !connJson.contains("fromPort") ||
                !connJson.contains("to") || !connJson.contains("toPort")) {
                throw std::runtime_error("Invalid connection: expected 'from', 'fromPort', 'to', 'toPort'");
            }
            graph.connect(connJson["from"].get<std::string>(),
                          connJson["fromPort"].get<std::string>(),
                          connJson["to"].get<std::string>(),
                          connJson["toPort"].get<std::string>());
        }
    }

    return graph;
}

NodeGraph NodeGraphSerializer::fromString(const std::string& str, const NodeRegistry& registry) {
    return fromJson(json::parse(str), registry);
}

NodeGraph NodeGraphSerializer::fromFile(const std::string& path, const NodeRegistry& registry) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open graph file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromString(buffer.str(), registry);
}

// =============================================================================
// Helpers - Value Serialization
// =============================================================================

json NodeGraphSerializer::valueToJson(const Value& v) {
    json result;
    result["type"] = valueTypeToString(v.getType());

    switch (v.getType()) {
        case ValueType::Scalar:
            result["value"] = v.getScalar();
            break;
        case ValueType::Vector: {
            Vec2 vec = v.getVector();
            result["value"] = json::array({vec.x, vec.y});
            break;
        }
        case ValueType::Text:
            result["value"] = v.getText();
            break;
        case ValueType::Series:
            result["value"] = dataframe::DataFrameSerializer::columnToJson(*v.getSeries());
            break;
        case ValueType::Frame:
            result["value"] = dataframe::DataFrameSerializer::toJson(*v.getFrame());
            break;
    }

    return result;
}

Value NodeGraphSerializer::jsonToValue(const json& j) {
    if (!j.is_object() || !j.contains("type")) {
        throw std::runtime_error("Invalid value: missing 'type'");
    }

    ValueType type = stringToValueType(j["type"].get<std::string>());
    if (!j.contains("value") || j["value"].is_null()) {
        return defaultValueFor(type);
    }
    const json& value = j["value"];

    switch (type) {
        case ValueType::Scalar:
            return Value(value.get<double>());

        case ValueType::Vector:
            if (!value.is_array() || value.size() != 2) {
                throw std::runtime_error("Invalid vector value: expected [x, y]");
            }
            return Value(Vec2{value[0].get<double>(), value[1].get<double>()});

        case ValueType::Text:
            return Value(value.get<std::string>());

        case ValueType::Series:
            return Value(dataframe::DataFrameSerializer::columnFromJson(value));

        case ValueType::Frame:
            return Value(dataframe::DataFrameSerializer::fromJson(value));
    }

    throw std::runtime_error("Invalid value type");
}

} // namespace nodes
