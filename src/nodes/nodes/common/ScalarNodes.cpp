#include "ScalarNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeContext.hpp"
#include "nodes/NodeRegistry.hpp"

namespace nodes {

// ============== Registration ==============

void registerScalarNodes(NodeRegistry& registry) {
    registerMakeScalarNode(registry);
    registerAddScalarNode(registry);
    registerSubtractScalarNode(registry);
}

// ============== Scalar nodes ==============

void registerMakeScalarNode(NodeRegistry& registry) {
    NodeBuilder("make_scalar", "Scalar")
        .label("New scalar")
        .input("value", Type::Scalar)
        .output("out", Type::Scalar)
        .onCompile([](NodeContext& ctx) {
            ctx.setOutput("out", ctx.getScalar("value"));
        })
        .buildAndRegister(registry);
}

void registerAddScalarNode(NodeRegistry& registry) {
    NodeBuilder("add_scalar", "Scalar")
        .label("Scalar add")
        .input("A", Type::Scalar)
        .input("B", Type::Scalar)
        .output("out", Type::Scalar)
        .onCompile([](NodeContext& ctx) {
            double a = ctx.getScalar("A");
            double b = ctx.getScalar("B");
            ctx.setOutput("out", a + b);
        })
        .buildAndRegister(registry);
}

void registerSubtractScalarNode(NodeRegistry& registry) {
    NodeBuilder("subtract_scalar", "Scalar")
        .label("Scalar subtract")
        .input("A", Type::Scalar)
        .input("B", Type::Scalar)
        .output("out", Type::Scalar)
        .onCompile([](NodeContext& ctx) {
            double a = ctx.getScalar("A");
            double b = ctx.getScalar("B");
            ctx.setOutput("out", a - b);
        })
        .buildAndRegister(registry);
}

} // namespace nodes
