#pragma once

#include "nodes/NodeDefinition.hpp"
#include <string>
#include <vector>

namespace nodes {

// Forward declaration
class NodeRegistry;

/**
 * Fluent API for building node definitions
 *
 * Example usage:
 *   NodeBuilder("add_scalar", "Scalar")
 *       .label("Scalar add")
 *       .input("A", Type::Scalar)
 *       .input("B", Type::Scalar)
 *       .output("out", Type::Scalar)
 *       .onCompile([](NodeContext& ctx) {
 *           double a = ctx.getScalar("A");
 *           double b = ctx.getScalar("B");
 *           ctx.setOutput("out", a + b);
 *       })
 *       .buildAndRegister();
 */
class NodeBuilder {
public:
    /**
     * Create a builder for a node with given name and primary category
     */
    NodeBuilder(const std::string& name, const std::string& category);

    /**
     * Label shown in the node finder (defaults to the name)
     */
    NodeBuilder& label(const std::string& label);

    /**
     * Add a secondary category
     */
    NodeBuilder& category(const std::string& category);

    // === Input Definition ===

    /**
     * Add an input holding the type's default constant
     */
    NodeBuilder& input(const std::string& name, ValueType type);

    /**
     * Add an input with an explicit default constant
     */
    NodeBuilder& input(const std::string& name, ValueType type, const Value& defaultValue,
                       InputKind kind = InputKind::ConnectionOrConstant);

    /**
     * Add an input that must be connected
     */
    NodeBuilder& inputConnectionOnly(const std::string& name, ValueType type);

    // === Output Definition ===

    NodeBuilder& output(const std::string& name, ValueType type);

    // === Compile Function ===

    /**
     * Set the compile function (node logic)
     */
    NodeBuilder& onCompile(CompileFunction func);

    // === Build ===

    /**
     * Build and return the node definition
     */
    NodeDefinitionPtr build();

    /**
     * Build and register in the global registry
     */
    NodeDefinitionPtr buildAndRegister();

    /**
     * Build and register in a specific registry
     */
    NodeDefinitionPtr buildAndRegister(NodeRegistry& registry);

private:
    std::string m_name;
    std::string m_label;
    std::vector<std::string> m_categories;
    std::vector<InputDef> m_inputs;
    std::vector<OutputDef> m_outputs;
    CompileFunction m_compileFunc;
};

// Convenience alias for cleaner API
using Type = ValueType;

} // namespace nodes
