#pragma once

namespace nodes {

class NodeRegistry;

/**
 * Register all 2D vector nodes
 */
void registerVectorNodes(NodeRegistry& registry);

/** make_vector - packs x and y */
void registerMakeVectorNode(NodeRegistry& registry);

/** add_vector - componentwise v1 + v2 */
void registerAddVectorNode(NodeRegistry& registry);

/** subtract_vector - componentwise v1 - v2 */
void registerSubtractVectorNode(NodeRegistry& registry);

/** vector_times_scalar - scales vector by scalar */
void registerVectorTimesScalarNode(NodeRegistry& registry);

} // namespace nodes
