#pragma once

namespace nodes {
class NodeRegistry;
}

namespace common {

/**
 * Register every built-in node kind, in finder order:
 * make_scalar, make_vector, the scalar and vector operators,
 * then the table nodes
 */
void registerNodes(nodes::NodeRegistry& registry);

/**
 * Register into the global registry
 */
void registerNodes();

} // namespace common
