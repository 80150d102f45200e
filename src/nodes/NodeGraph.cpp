#include "nodes/NodeGraph.hpp"
#include <algorithm>
#include <stdexcept>

namespace nodes {

// =============================================================================
// NodeInstance
// =============================================================================

const InputPort* NodeInstance::findInput(const std::string& name) const {
    for (const auto& port : inputs) {
        if (port.name == name) return &port;
    }
    return nullptr;
}

InputPort* NodeInstance::findInput(const std::string& name) {
    for (auto& port : inputs) {
        if (port.name == name) return &port;
    }
    return nullptr;
}

const OutputPort* NodeInstance::findOutput(const std::string& name) const {
    for (const auto& port : outputs) {
        if (port.name == name) return &port;
    }
    return nullptr;
}

// =============================================================================
// NodeGraph
// =============================================================================

std::string NodeGraph::addNode(const NodeDefinition& definition) {
    std::string id = "node_" + std::to_string(m_nextId++);
    instantiate(id, definition);
    return id;
}

void NodeGraph::addNodeWithId(const std::string& id, const NodeDefinition& definition) {
    if (m_nodes.count(id) > 0) {
        throw std::invalid_argument("Duplicate node id: " + id);
    }
    instantiate(id, definition);

    // Keep generated "node_X" ids ahead of loaded ones
    if (id.rfind("node_", 0) == 0 && id.size() > 5) {
        std::string digits = id.substr(5);
        if (std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })
            && digits.size() < 19) {
            uint64_t num = std::stoull(digits);
            if (num >= m_nextId) {
                m_nextId = num + 1;
            }
        }
    }
}

void NodeGraph::instantiate(const std::string& id, const NodeDefinition& definition) {
    NodeInstance instance;
    instance.id = id;
    instance.kind = definition.getName();

    for (const auto& def : definition.getInputs()) {
        InputPort port;
        port.id = m_nextPortId++;
        port.name = def.name;
        port.type = def.type;
        port.value = def.defaultValue;
        port.kind = def.kind;
        instance.inputs.push_back(std::move(port));
    }
    for (const auto& def : definition.getOutputs()) {
        OutputPort port;
        port.id = m_nextPortId++;
        port.name = def.name;
        port.type = def.type;
        m_outputOwners[port.id] = id;
        instance.outputs.push_back(std::move(port));
    }

    m_nodes[id] = std::move(instance);
    m_order.push_back(id);
}

void NodeGraph::removeNode(const std::string& nodeId) {
    auto it = m_nodes.find(nodeId);
    if (it == m_nodes.end()) {
        return;
    }
    for (const auto& port : it->second.outputs) {
        m_outputOwners.erase(port.id);
    }
    m_nodes.erase(it);
    m_order.erase(std::remove(m_order.begin(), m_order.end(), nodeId), m_order.end());

    // Remove all connections involving this node
    m_connections.erase(
        std::remove_if(m_connections.begin(), m_connections.end(),
            [&nodeId](const Connection& c) {
                return c.sourceNodeId == nodeId || c.targetNodeId == nodeId;
            }),
        m_connections.end()
    );
}

NodeInstance* NodeGraph::getNode(const std::string& nodeId) {
    auto it = m_nodes.find(nodeId);
    return it != m_nodes.end() ? &it->second : nullptr;
}

const NodeInstance* NodeGraph::getNode(const std::string& nodeId) const {
    auto it = m_nodes.find(nodeId);
    return it != m_nodes.end() ? &it->second : nullptr;
}

NodeInstance& NodeGraph::requireNode(const std::string& nodeId) {
    auto* node = getNode(nodeId);
    if (!node) {
        throw std::invalid_argument("Node not found: " + nodeId);
    }
    return *node;
}

const NodeInstance& NodeGraph::requireNode(const std::string& nodeId) const {
    const auto* node = getNode(nodeId);
    if (!node) {
        throw std::invalid_argument("Node not found: " + nodeId);
    }
    return *node;
}

const NodeInstance* NodeGraph::findOutputOwner(PortId outputId) const {
    auto it = m_outputOwners.find(outputId);
    if (it == m_outputOwners.end()) {
        return nullptr;
    }
    return getNode(it->second);
}

void NodeGraph::connect(const std::string& sourceNodeId, const std::string& sourcePort,
                        const std::string& targetNodeId, const std::string& targetPort) {
    const NodeInstance& source = requireNode(sourceNodeId);
    const NodeInstance& target = requireNode(targetNodeId);

    const OutputPort* out = source.findOutput(sourcePort);
    if (!out) {
        throw std::invalid_argument("Node '" + sourceNodeId + "' has no output named '" + sourcePort + "'");
    }
    const InputPort* in = target.findInput(targetPort);
    if (!in) {
        throw std::invalid_argument("Node '" + targetNodeId + "' has no input named '" + targetPort + "'");
    }
    if (out->type != in->type) {
        throw std::invalid_argument(
            "Cannot connect " + valueTypeToString(out->type) + " output '" + sourcePort +
            "' to " + valueTypeToString(in->type) + " input '" + targetPort + "'");
    }
    if (in->kind == InputKind::ConstantOnly) {
        throw std::invalid_argument("Input '" + targetPort + "' of '" + targetNodeId + "' accepts constants only");
    }

    // Remove existing connection to this target port (if any)
    disconnect(targetNodeId, targetPort);

    Connection conn;
    conn.sourceNodeId = sourceNodeId;
    conn.sourcePortName = sourcePort;
    conn.targetNodeId = targetNodeId;
    conn.targetPortName = targetPort;
    conn.source = out->id;
    conn.target = in->id;
    m_connections.push_back(std::move(conn));
}

void NodeGraph::disconnect(const std::string& targetNodeId, const std::string& targetPort) {
    m_connections.erase(
        std::remove_if(m_connections.begin(), m_connections.end(),
            [&](const Connection& c) {
                return c.targetNodeId == targetNodeId && c.targetPortName == targetPort;
            }),
        m_connections.end()
    );
}

const Connection* NodeGraph::getConnectionTo(const std::string& targetNodeId,
                                             const std::string& targetPort) const {
    for (const auto& conn : m_connections) {
        if (conn.targetNodeId == targetNodeId && conn.targetPortName == targetPort) {
            return &conn;
        }
    }
    return nullptr;
}

void NodeGraph::setInputValue(const std::string& nodeId, const std::string& portName, const Value& value) {
    InputPort* port = requireNode(nodeId).findInput(portName);
    if (!port) {
        throw std::invalid_argument("Node '" + nodeId + "' has no input named '" + portName + "'");
    }
    if (value.getType() != port->type) {
        throw std::invalid_argument(
            "Input '" + portName + "' expects " + valueTypeToString(port->type) +
            ", got " + valueTypeToString(value.getType()));
    }
    port->value = value;
}

const Value& NodeGraph::getInputValue(const std::string& nodeId, const std::string& portName) const {
    const InputPort* port = requireNode(nodeId).findInput(portName);
    if (!port) {
        throw std::invalid_argument("Node '" + nodeId + "' has no input named '" + portName + "'");
    }
    return port->value;
}

void NodeGraph::setPosition(const std::string& nodeId, double x, double y) {
    requireNode(nodeId).position = std::make_pair(x, y);
}

} // namespace nodes
