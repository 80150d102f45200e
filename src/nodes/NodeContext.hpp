#pragma once

#include "nodes/Types.hpp"
#include <string>
#include <memory>

namespace nodes {

class NodeExecutor;
class NodeGraph;
class OutputCache;

/**
 * Execution context passed to node compile functions.
 * Inputs are resolved lazily: reading a connected input evaluates the
 * upstream node on first use. Outputs go straight to the request cache.
 *
 * Usage in onCompile:
 *   void onCompile(NodeContext& ctx) {
 *       double a = ctx.getScalar("A");
 *       ctx.setOutput("out", a * 2);
 *   }
 */
class NodeContext {
public:
    NodeContext(NodeExecutor& executor, const NodeGraph& graph,
                OutputCache& cache, const std::string& nodeId);

    const std::string& getNodeId() const { return m_nodeId; }

    // === Input Access (called by node logic) ===

    /**
     * Resolve an input to its connected upstream value or its constant
     */
    Value getInput(const std::string& name) const;

    /**
     * Typed shortcuts; throw TypeMismatchError on a different tag
     */
    double getScalar(const std::string& name) const;
    Vec2 getVector(const std::string& name) const;
    std::string getText(const std::string& name) const;
    dataframe::IColumnPtr getSeries(const std::string& name) const;
    std::shared_ptr<dataframe::DataFrame> getFrame(const std::string& name) const;

    // === Output Setting (called by node logic) ===

    /**
     * Populate a declared output, returns the stored value
     */
    Value setOutput(const std::string& name, const Value& value);

private:
    NodeExecutor& m_executor;
    const NodeGraph& m_graph;
    OutputCache& m_cache;
    std::string m_nodeId;
};

} // namespace nodes
