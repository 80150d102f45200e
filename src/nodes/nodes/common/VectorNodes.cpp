#include "VectorNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeContext.hpp"
#include "nodes/NodeRegistry.hpp"

namespace nodes {

// ============== Registration ==============

void registerVectorNodes(NodeRegistry& registry) {
    registerMakeVectorNode(registry);
    registerAddVectorNode(registry);
    registerSubtractVectorNode(registry);
    registerVectorTimesScalarNode(registry);
}

// ============== Vector nodes ==============

void registerMakeVectorNode(NodeRegistry& registry) {
    NodeBuilder("make_vector", "Vector")
        .label("New vector")
        .input("x", Type::Scalar)
        .input("y", Type::Scalar)
        .output("out", Type::Vector)
        .onCompile([](NodeContext& ctx) {
            double x = ctx.getScalar("x");
            double y = ctx.getScalar("y");
            ctx.setOutput("out", Vec2{x, y});
        })
        .buildAndRegister(registry);
}

void registerAddVectorNode(NodeRegistry& registry) {
    NodeBuilder("add_vector", "Vector")
        .label("Vector add")
        .input("v1", Type::Vector)
        .input("v2", Type::Vector)
        .output("out", Type::Vector)
        .onCompile([](NodeContext& ctx) {
            Vec2 v1 = ctx.getVector("v1");
            Vec2 v2 = ctx.getVector("v2");
            ctx.setOutput("out", v1 + v2);
        })
        .buildAndRegister(registry);
}

void registerSubtractVectorNode(NodeRegistry& registry) {
    NodeBuilder("subtract_vector", "Vector")
        .label("Vector subtract")
        .input("v1", Type::Vector)
        .input("v2", Type::Vector)
        .output("out", Type::Vector)
        .onCompile([](NodeContext& ctx) {
            Vec2 v1 = ctx.getVector("v1");
            Vec2 v2 = ctx.getVector("v2");
            ctx.setOutput("out", v1 - v2);
        })
        .buildAndRegister(registry);
}

void registerVectorTimesScalarNode(NodeRegistry& registry) {
    NodeBuilder("vector_times_scalar", "Vector")
        .category("Scalar")
        .label("Vector times scalar")
        .input("scalar", Type::Scalar)
        .input("vector", Type::Vector)
        .output("out", Type::Vector)
        .onCompile([](NodeContext& ctx) {
            double scalar = ctx.getScalar("scalar");
            Vec2 vector = ctx.getVector("vector");
            ctx.setOutput("out", vector * scalar);
        })
        .buildAndRegister(registry);
}

} // namespace nodes
