#include "register.hpp"
#include "ScalarNodes.hpp"
#include "VectorNodes.hpp"
#include "CsvNodes.hpp"
#include "SelectNodes.hpp"
#include "nodes/NodeRegistry.hpp"

namespace common {

void registerNodes(nodes::NodeRegistry& registry) {
    // Constructors first, then operators, then table nodes
    nodes::registerMakeScalarNode(registry);
    nodes::registerMakeVectorNode(registry);
    nodes::registerAddScalarNode(registry);
    nodes::registerSubtractScalarNode(registry);
    nodes::registerAddVectorNode(registry);
    nodes::registerSubtractVectorNode(registry);
    nodes::registerVectorTimesScalarNode(registry);
    nodes::registerCsvNodes(registry);
    nodes::registerSelectNodes(registry);
}

void registerNodes() {
    registerNodes(nodes::NodeRegistry::instance());
}

} // namespace common
