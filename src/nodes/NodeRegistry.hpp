#pragma once

#include "nodes/NodeDefinition.hpp"
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>

namespace nodes {

/**
 * Catalog of node templates, keyed by kind name
 *
 * Supports both singleton access (global registry) and custom instances
 * for testing or isolated environments.
 *
 * Usage:
 *   // Global registry
 *   NodeRegistry::instance().registerNode(def);
 *   auto node = NodeRegistry::instance().getNode("add_scalar");
 *
 *   // Custom registry
 *   NodeRegistry myRegistry;
 *   myRegistry.registerNode(def);
 */
class NodeRegistry {
public:
    NodeRegistry() = default;

    // Non-copyable
    NodeRegistry(const NodeRegistry&) = delete;
    NodeRegistry& operator=(const NodeRegistry&) = delete;

    // Movable
    NodeRegistry(NodeRegistry&&) = default;
    NodeRegistry& operator=(NodeRegistry&&) = default;

    /**
     * Get the global singleton instance
     */
    static NodeRegistry& instance();

    // === Registration ===

    /**
     * Register a node definition
     * Overwrites if a node with the same name already exists
     */
    void registerNode(NodeDefinitionPtr definition);

    void unregisterNode(const std::string& name);

    // === Lookup ===

    /**
     * Get a node definition by name
     * Returns nullptr if not found
     */
    NodeDefinitionPtr getNode(const std::string& name) const;

    /**
     * Get a node definition by name
     * Throws UnknownKindError if not found
     */
    const NodeDefinition& require(const std::string& name) const;

    bool hasNode(const std::string& name) const;

    // === Enumeration ===

    /**
     * All registered node names, in registration order
     */
    const std::vector<std::string>& getNodeNames() const { return m_order; }

    /**
     * Node names carrying the given category, in registration order
     */
    std::vector<std::string> getNodeNamesInCategory(const std::string& category) const;

    /**
     * Distinct categories, sorted
     */
    std::vector<std::string> getCategories() const;

    size_t size() const { return m_nodes.size(); }

    // === Clear ===

    void clear();

private:
    std::unordered_map<std::string, NodeDefinitionPtr> m_nodes;
    std::vector<std::string> m_order;
};

} // namespace nodes
