#pragma once

#include "nodes/Types.hpp"
#include <string>
#include <vector>
#include <functional>
#include <memory>

namespace nodes {

class NodeContext;

/**
 * Compile function signature
 * Called when the node is evaluated
 */
using CompileFunction = std::function<void(NodeContext&)>;

/**
 * How an input port may receive its value
 */
enum class InputKind {
    ConnectionOnly,        // Must be wired; the constant is never edited
    ConstantOnly,          // Inline widget only; cannot be connected
    ConnectionOrConstant   // Inline constant, replaced by a connection when wired
};

/**
 * Definition of a node input port
 */
struct InputDef {
    std::string name;
    ValueType type;
    Value defaultValue;
    InputKind kind = InputKind::ConnectionOrConstant;

    InputDef(std::string n, ValueType t, Value def, InputKind k = InputKind::ConnectionOrConstant)
        : name(std::move(n)), type(t), defaultValue(std::move(def)), kind(k) {}
};

/**
 * Definition of a node output port
 */
struct OutputDef {
    std::string name;
    ValueType type;

    OutputDef(std::string n, ValueType t)
        : name(std::move(n)), type(t) {}
};

/**
 * Complete node definition - immutable after creation
 *
 * Describes a node kind: its name, finder label, categories, inputs,
 * outputs, and the compile function that implements its logic.
 * The first declared output is the designated output returned
 * when the node is evaluated.
 */
class NodeDefinition {
public:
    NodeDefinition(
        std::string name,
        std::string label,
        std::vector<std::string> categories,
        std::vector<InputDef> inputs,
        std::vector<OutputDef> outputs,
        CompileFunction compileFunc
    );

    // Getters
    const std::string& getName() const { return m_name; }
    const std::string& getLabel() const { return m_label; }
    const std::vector<std::string>& getCategories() const { return m_categories; }
    const std::vector<InputDef>& getInputs() const { return m_inputs; }
    const std::vector<OutputDef>& getOutputs() const { return m_outputs; }

    bool hasCategory(const std::string& category) const;

    /**
     * Find an input definition by name
     * Returns nullptr if not found
     */
    const InputDef* findInput(const std::string& name) const;

    /**
     * Find an output definition by name
     * Returns nullptr if not found
     */
    const OutputDef* findOutput(const std::string& name) const;

    /**
     * Execute the node's compile function
     */
    void compile(NodeContext& ctx) const;

private:
    std::string m_name;
    std::string m_label;
    std::vector<std::string> m_categories;
    std::vector<InputDef> m_inputs;
    std::vector<OutputDef> m_outputs;
    CompileFunction m_compileFunc;
};

using NodeDefinitionPtr = std::shared_ptr<const NodeDefinition>;

} // namespace nodes
