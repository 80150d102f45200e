#include "nodes/NodeDefinition.hpp"
#include "nodes/NodeContext.hpp"
#include <algorithm>

namespace nodes {

NodeDefinition::NodeDefinition(
    std::string name,
    std::string label,
    std::vector<std::string> categories,
    std::vector<InputDef> inputs,
    std::vector<OutputDef> outputs,
    CompileFunction compileFunc
)
    : m_name(std::move(name))
    , m_label(std::move(label))
    , m_categories(std::move(categories))
    , m_inputs(std::move(inputs))
    , m_outputs(std::move(outputs))
    , m_compileFunc(std::move(compileFunc))
{
    if (m_label.empty()) {
        m_label = m_name;
    }
}

bool NodeDefinition::hasCategory(const std::string& category) const {
    return std::find(m_categories.begin(), m_categories.end(), category) != m_categories.end();
}

const InputDef* NodeDefinition::findInput(const std::string& name) const {
    for (const auto& input : m_inputs) {
        if (input.name == name) {
            return &input;
        }
    }
    return nullptr;
}

const OutputDef* NodeDefinition::findOutput(const std::string& name) const {
    for (const auto& output : m_outputs) {
        if (output.name == name) {
            return &output;
        }
    }
    return nullptr;
}

void NodeDefinition::compile(NodeContext& ctx) const {
    if (m_compileFunc) {
        m_compileFunc(ctx);
    }
}

} // namespace nodes
