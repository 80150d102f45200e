#pragma once

namespace nodes {

class NodeRegistry;

/**
 * Register all scalar nodes
 */
void registerScalarNodes(NodeRegistry& registry);

/** make_scalar - forwards its "value" input */
void registerMakeScalarNode(NodeRegistry& registry);

/** add_scalar - A + B */
void registerAddScalarNode(NodeRegistry& registry);

/** subtract_scalar - A - B */
void registerSubtractScalarNode(NodeRegistry& registry);

} // namespace nodes
