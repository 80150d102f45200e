#pragma once

#include "nodes/Types.hpp"
#include "nodes/Errors.hpp"
#include "nodes/NodeGraph.hpp"
#include "nodes/NodeContext.hpp"
#include "nodes/NodeDefinition.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/OutputCache.hpp"
#include "nodes/ExecutionEvent.hpp"
#include <string>
#include <unordered_set>
#include <optional>

namespace nodes {

/**
 * Result of evaluating a single node with a fresh cache
 */
struct NodeResult {
    std::string nodeId;
    Value value;                          // Designated output (valid when !hasError)
    size_t cachedOutputs = 0;             // Outputs computed during the request
    bool hasError = false;
    std::optional<ErrorKind> errorKind;   // Unset for failures outside EvalError
    std::string errorMessage;
    std::string failedNodeId;             // Node whose compute step raised the error
};

/**
 * Demand-driven evaluator for a node graph
 *
 * Evaluating a node resolves its inputs on demand: a connected input
 * evaluates the upstream node first, an unconnected one yields its constant.
 * Every output computed during a request is memoized in the OutputCache,
 * so each node's compute step runs at most once per request.
 *
 * One executor serves one request at a time.
 */
class NodeExecutor {
public:
    /**
     * Create executor with a registry to look up node definitions
     */
    explicit NodeExecutor(const NodeRegistry& registry);

    /**
     * Set callback for per-node execution events
     */
    void setExecutionCallback(ExecutionCallback callback);

    /**
     * Evaluate a node with a fresh cache.
     * Evaluation failures are reported in the result, never thrown.
     */
    NodeResult evaluate(const NodeGraph& graph, const std::string& nodeId);

    /**
     * Evaluate a node against an existing cache, returns its designated output.
     * A node already computed in this cache is not recomputed.
     * Throws EvalError subclasses on failure.
     */
    Value evaluate(const NodeGraph& graph, const std::string& nodeId, OutputCache& cache);

    /**
     * Value of an input port: the cached upstream output when connected
     * (evaluating the upstream node on a miss), otherwise the port's constant.
     */
    Value resolveInput(const NodeGraph& graph, const std::string& nodeId,
                       const std::string& portName, OutputCache& cache);

    /**
     * Store a computed value for a declared output and return it
     */
    Value populateOutput(const NodeGraph& graph, OutputCache& cache, const std::string& nodeId,
                         const std::string& outputName, const Value& value);

private:
    const NodeRegistry& m_registry;
    ExecutionCallback m_callback;  // Optional callback for per-node events
    std::unordered_set<std::string> m_visiting;  // Nodes on the current descent

    Value compute(const NodeGraph& graph, const NodeInstance& node,
                  const NodeDefinition& definition, OutputCache& cache);

    void discardOutputs(const NodeInstance& node, OutputCache& cache);
    void emit(const ExecutionEvent& event) const;
};

} // namespace nodes
