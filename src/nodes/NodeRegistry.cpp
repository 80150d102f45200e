#include "nodes/NodeRegistry.hpp"
#include "nodes/Errors.hpp"
#include <algorithm>
#include <set>

namespace nodes {

NodeRegistry& NodeRegistry::instance() {
    static NodeRegistry instance;
    return instance;
}

void NodeRegistry::registerNode(NodeDefinitionPtr definition) {
    if (!definition) {
        return;
    }
    const std::string& name = definition->getName();
    if (m_nodes.find(name) == m_nodes.end()) {
        m_order.push_back(name);
    }
    m_nodes[name] = std::move(definition);
}

void NodeRegistry::unregisterNode(const std::string& name) {
    if (m_nodes.erase(name) > 0) {
        m_order.erase(std::remove(m_order.begin(), m_order.end(), name), m_order.end());
    }
}

NodeDefinitionPtr NodeRegistry::getNode(const std::string& name) const {
    auto it = m_nodes.find(name);
    if (it != m_nodes.end()) {
        return it->second;
    }
    return nullptr;
}

const NodeDefinition& NodeRegistry::require(const std::string& name) const {
    auto it = m_nodes.find(name);
    if (it == m_nodes.end()) {
        throw UnknownKindError(name);
    }
    return *it->second;
}

bool NodeRegistry::hasNode(const std::string& name) const {
    return m_nodes.find(name) != m_nodes.end();
}

std::vector<std::string> NodeRegistry::getNodeNamesInCategory(const std::string& category) const {
    std::vector<std::string> names;
    for (const auto& name : m_order) {
        if (m_nodes.at(name)->hasCategory(category)) {
            names.push_back(name);
        }
    }
    return names;
}

std::vector<std::string> NodeRegistry::getCategories() const {
    std::set<std::string> categories;
    for (const auto& [name, def] : m_nodes) {
        for (const auto& category : def->getCategories()) {
            categories.insert(category);
        }
    }
    return std::vector<std::string>(categories.begin(), categories.end());
}

void NodeRegistry::clear() {
    m_nodes.clear();
    m_order.clear();
}

} // namespace nodes
