#include "nodes/NodeContext.hpp"
#include "nodes/NodeExecutor.hpp"

namespace nodes {

NodeContext::NodeContext(NodeExecutor& executor, const NodeGraph& graph,
                         OutputCache& cache, const std::string& nodeId)
    : m_executor(executor)
    , m_graph(graph)
    , m_cache(cache)
    , m_nodeId(nodeId)
{}

Value NodeContext::getInput(const std::string& name) const {
    return m_executor.resolveInput(m_graph, m_nodeId, name, m_cache);
}

double NodeContext::getScalar(const std::string& name) const {
    return getInput(name).getScalar();
}

Vec2 NodeContext::getVector(const std::string& name) const {
    return getInput(name).getVector();
}

std::string NodeContext::getText(const std::string& name) const {
    return getInput(name).getText();
}

dataframe::IColumnPtr NodeContext::getSeries(const std::string& name) const {
    return getInput(name).getSeries();
}

std::shared_ptr<dataframe::DataFrame> NodeContext::getFrame(const std::string& name) const {
    return getInput(name).getFrame();
}

Value NodeContext::setOutput(const std::string& name, const Value& value) {
    return m_executor.populateOutput(m_graph, m_cache, m_nodeId, name, value);
}

} // namespace nodes
