#pragma once

#include "nodes/Types.hpp"
#include "nodes/NodeDefinition.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

namespace nodes {

/**
 * Stable identity of a port, unique within a graph.
 * Output port ids key the evaluation cache.
 */
using PortId = uint64_t;

struct InputPort {
    PortId id = 0;
    std::string name;
    ValueType type = ValueType::Scalar;
    Value value;                 // Constant used while unconnected
    InputKind kind = InputKind::ConnectionOrConstant;
};

struct OutputPort {
    PortId id = 0;
    std::string name;
    ValueType type = ValueType::Scalar;
};

/**
 * Instance of a node in a graph
 */
struct NodeInstance {
    std::string id;                // Unique instance ID (e.g., "node_1")
    std::string kind;              // Registered definition name (e.g., "add_scalar")
    std::vector<InputPort> inputs;
    std::vector<OutputPort> outputs;
    std::optional<std::pair<double, double>> position;  // Editor [x, y]

    const InputPort* findInput(const std::string& name) const;
    InputPort* findInput(const std::string& name);
    const OutputPort* findOutput(const std::string& name) const;
};

/**
 * Connection from an output port to an input port
 */
struct Connection {
    std::string sourceNodeId;
    std::string sourcePortName;
    std::string targetNodeId;
    std::string targetPortName;
    PortId source = 0;
    PortId target = 0;
};

/**
 * A complete node graph
 *
 * Owns node instances (and through them their ports) and the
 * connections between them. Mutated by the editor; NodeExecutor
 * only reads it through the const accessors.
 */
class NodeGraph {
public:
    NodeGraph() = default;

    // === Node Management ===

    /**
     * Instantiate a definition, returns the new node ID
     */
    std::string addNode(const NodeDefinition& definition);

    /**
     * Instantiate a definition under a specific ID (for deserialization)
     * Updates the ID counter if needed. Throws std::invalid_argument if the ID is taken.
     */
    void addNodeWithId(const std::string& id, const NodeDefinition& definition);

    /**
     * Remove a node and all connections touching its ports
     */
    void removeNode(const std::string& nodeId);

    NodeInstance* getNode(const std::string& nodeId);
    const NodeInstance* getNode(const std::string& nodeId) const;
    bool hasNode(const std::string& nodeId) const { return getNode(nodeId) != nullptr; }

    /**
     * Node that owns an output port, nullptr if unknown
     */
    const NodeInstance* findOutputOwner(PortId outputId) const;

    // === Connection Management ===

    /**
     * Connect an output to an input, replacing the input's existing connection.
     * Throws std::invalid_argument when a node or port is missing, the data
     * types differ, or the input accepts constants only.
     */
    void connect(const std::string& sourceNodeId, const std::string& sourcePort,
                 const std::string& targetNodeId, const std::string& targetPort);

    /**
     * Disconnect an input
     */
    void disconnect(const std::string& targetNodeId, const std::string& targetPort);

    /**
     * Get the connection for a target input (if any)
     */
    const Connection* getConnectionTo(const std::string& targetNodeId,
                                      const std::string& targetPort) const;

    // === Input constants ===

    /**
     * Set the constant of an input port.
     * Throws std::invalid_argument for a missing node/port or a value of another type.
     */
    void setInputValue(const std::string& nodeId, const std::string& portName, const Value& value);

    /**
     * Get the constant of an input port
     * Throws std::invalid_argument for a missing node/port
     */
    const Value& getInputValue(const std::string& nodeId, const std::string& portName) const;

    void setPosition(const std::string& nodeId, double x, double y);

    // === Getters ===

    const std::unordered_map<std::string, NodeInstance>& getNodes() const { return m_nodes; }

    /**
     * Node IDs in insertion order
     */
    const std::vector<std::string>& getNodeIds() const { return m_order; }

    const std::vector<Connection>& getConnections() const { return m_connections; }
    size_t nodeCount() const { return m_nodes.size(); }

    uint64_t getNextId() const { return m_nextId; }

private:
    std::unordered_map<std::string, NodeInstance> m_nodes;
    std::vector<std::string> m_order;
    std::vector<Connection> m_connections;
    std::unordered_map<PortId, std::string> m_outputOwners;
    uint64_t m_nextId = 1;
    PortId m_nextPortId = 1;

    void instantiate(const std::string& id, const NodeDefinition& definition);
    NodeInstance& requireNode(const std::string& nodeId);
    const NodeInstance& requireNode(const std::string& nodeId) const;
};

} // namespace nodes
