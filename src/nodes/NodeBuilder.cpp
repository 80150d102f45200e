#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeRegistry.hpp"
#include <stdexcept>

namespace nodes {

NodeBuilder::NodeBuilder(const std::string& name, const std::string& category)
    : m_name(name)
    , m_categories{category}
{}

NodeBuilder& NodeBuilder::label(const std::string& label) {
    m_label = label;
    return *this;
}

NodeBuilder& NodeBuilder::category(const std::string& category) {
    m_categories.push_back(category);
    return *this;
}

NodeBuilder& NodeBuilder::input(const std::string& name, ValueType type) {
    m_inputs.emplace_back(name, type, defaultValueFor(type));
    return *this;
}

NodeBuilder& NodeBuilder::input(const std::string& name, ValueType type, const Value& defaultValue,
                                InputKind kind) {
    if (defaultValue.getType() != type) {
        throw std::invalid_argument(
            "Default of input '" + name + "' is " + valueTypeToString(defaultValue.getType()) +
            ", declared " + valueTypeToString(type));
    }
    m_inputs.emplace_back(name, type, defaultValue, kind);
    return *this;
}

NodeBuilder& NodeBuilder::inputConnectionOnly(const std::string& name, ValueType type) {
    m_inputs.emplace_back(name, type, defaultValueFor(type), InputKind::ConnectionOnly);
    return *this;
}

NodeBuilder& NodeBuilder::output(const std::string& name, ValueType type) {
    m_outputs.emplace_back(name, type);
    return *this;
}

NodeBuilder& NodeBuilder::onCompile(CompileFunction func) {
    m_compileFunc = std::move(func);
    return *this;
}

NodeDefinitionPtr NodeBuilder::build() {
    return std::make_shared<NodeDefinition>(
        m_name,
        m_label,
        std::move(m_categories),
        std::move(m_inputs),
        std::move(m_outputs),
        std::move(m_compileFunc)
    );
}

NodeDefinitionPtr NodeBuilder::buildAndRegister() {
    return buildAndRegister(NodeRegistry::instance());
}

NodeDefinitionPtr NodeBuilder::buildAndRegister(NodeRegistry& registry) {
    auto def = build();
    registry.registerNode(def);
    return def;
}

} // namespace nodes
