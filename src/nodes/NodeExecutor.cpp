#include "nodes/NodeExecutor.hpp"
#include "app/Logger.hpp"
#include <chrono>

namespace nodes {

namespace {

int64_t elapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

/**
 * Keeps a node on the current descent for the lifetime of the guard
 */
class VisitGuard {
public:
    VisitGuard(std::unordered_set<std::string>& visiting, const std::string& nodeId)
        : m_visiting(visiting), m_nodeId(nodeId) {}
    ~VisitGuard() { m_visiting.erase(m_nodeId); }

    VisitGuard(const VisitGuard&) = delete;
    VisitGuard& operator=(const VisitGuard&) = delete;

private:
    std::unordered_set<std::string>& m_visiting;
    std::string m_nodeId;
};

} // anonymous namespace

NodeExecutor::NodeExecutor(const NodeRegistry& registry)
    : m_registry(registry)
{}

void NodeExecutor::setExecutionCallback(ExecutionCallback callback) {
    m_callback = std::move(callback);
}

void NodeExecutor::emit(const ExecutionEvent& event) const {
    if (m_callback) {
        m_callback(event);
    }
}

NodeResult NodeExecutor::evaluate(const NodeGraph& graph, const std::string& nodeId) {
    NodeResult result;
    result.nodeId = nodeId;

    OutputCache cache;
    m_visiting.clear();

    try {
        result.value = evaluate(graph, nodeId, cache);
    } catch (const EvalError& e) {
        result.hasError = true;
        result.errorKind = e.kind();
        result.errorMessage = e.what();
        result.failedNodeId = e.nodeId();
    } catch (const std::exception& e) {
        result.hasError = true;
        result.errorMessage = e.what();
    }
    result.cachedOutputs = cache.size();

    if (result.hasError) {
        LOG_WARN("Evaluation of " + nodeId + " failed at " +
                 (result.failedNodeId.empty() ? std::string("?") : result.failedNodeId) +
                 ": " + result.errorMessage);
    }
    return result;
}

Value NodeExecutor::evaluate(const NodeGraph& graph, const std::string& nodeId, OutputCache& cache) {
    const NodeInstance* node = graph.getNode(nodeId);
    if (!node) {
        throw UnknownNodeError(nodeId);
    }

    const NodeDefinition* definition = nullptr;
    try {
        definition = &m_registry.require(node->kind);
    } catch (EvalError& e) {
        e.setNodeId(nodeId);
        throw;
    }

    if (node->outputs.empty()) {
        CacheInvariantError err("Node '" + nodeId + "' declares no outputs");
        err.setNodeId(nodeId);
        throw err;
    }

    // Already computed in this request
    if (const Value* cached = cache.find(node->outputs.front().id)) {
        LOG_DEBUG("Cache hit for " + nodeId);
        return *cached;
    }

    if (!m_visiting.insert(nodeId).second) {
        CycleError err(nodeId);
        err.setNodeId(nodeId);
        throw err;
    }

    VisitGuard guard(m_visiting, nodeId);
    return compute(graph, *node, *definition, cache);
}

Value NodeExecutor::compute(const NodeGraph& graph, const NodeInstance& node,
                            const NodeDefinition& definition, OutputCache& cache) {
    LOG_DEBUG("Computing " + node.id + " (" + node.kind + ")");

    ExecutionEvent started;
    started.nodeId = node.id;
    started.kind = node.kind;
    started.status = ExecutionStatus::Started;
    emit(started);

    auto startTime = std::chrono::steady_clock::now();

    ExecutionEvent finished;
    finished.nodeId = node.id;
    finished.kind = node.kind;

    try {
        NodeContext ctx(*this, graph, cache, node.id);
        definition.compile(ctx);

        for (const auto& port : node.outputs) {
            if (!cache.contains(port.id)) {
                throw CacheInvariantError(
                    "Node '" + node.id + "' did not populate output '" + port.name + "'");
            }
        }
    } catch (EvalError& e) {
        // Innermost node wins; upstream failures keep their origin
        if (e.nodeId().empty()) {
            e.setNodeId(node.id);
        }
        discardOutputs(node, cache);
        finished.status = ExecutionStatus::Failed;
        finished.durationMs = elapsedMs(startTime);
        finished.errorMessage = e.what();
        emit(finished);
        throw;
    } catch (const std::exception& e) {
        discardOutputs(node, cache);
        finished.status = ExecutionStatus::Failed;
        finished.durationMs = elapsedMs(startTime);
        finished.errorMessage = e.what();
        emit(finished);
        throw;
    }

    const Value& designated = *cache.find(node.outputs.front().id);

    finished.status = ExecutionStatus::Completed;
    finished.durationMs = elapsedMs(startTime);
    if (designated.is(ValueType::Frame)) {
        auto df = designated.getFrame();
        finished.frameMetadata = {
            {"rows", df->rowCount()},
            {"columns", df->getColumnNames()}
        };
    }
    emit(finished);

    LOG_DEBUG("Computed " + node.id + " = " + designated.describe());
    return designated;
}

// A failed node leaves nothing behind for later requests sharing the cache
void NodeExecutor::discardOutputs(const NodeInstance& node, OutputCache& cache) {
    for (const auto& port : node.outputs) {
        cache.erase(port.id);
    }
}

Value NodeExecutor::resolveInput(const NodeGraph& graph, const std::string& nodeId,
                                 const std::string& portName, OutputCache& cache) {
    const NodeInstance* node = graph.getNode(nodeId);
    if (!node) {
        throw UnknownNodeError(nodeId);
    }
    const InputPort* port = node->findInput(portName);
    if (!port) {
        throw UnknownPortError(nodeId, portName, true);
    }

    const Connection* conn = graph.getConnectionTo(nodeId, portName);
    if (!conn) {
        return port->value;
    }

    if (const Value* cached = cache.find(conn->source)) {
        return *cached;
    }

    const NodeInstance* upstream = graph.findOutputOwner(conn->source);
    if (!upstream) {
        throw UnknownNodeError(conn->sourceNodeId);
    }
    evaluate(graph, upstream->id, cache);

    const Value* value = cache.find(conn->source);
    if (!value) {
        throw CacheInvariantError(
            "Output '" + conn->sourcePortName + "' of '" + upstream->id + "' missing after evaluation");
    }
    return *value;
}

Value NodeExecutor::populateOutput(const NodeGraph& graph, OutputCache& cache, const std::string& nodeId,
                                   const std::string& outputName, const Value& value) {
    const NodeInstance* node = graph.getNode(nodeId);
    if (!node) {
        throw UnknownNodeError(nodeId);
    }
    const OutputPort* port = node->findOutput(outputName);
    if (!port) {
        throw UnknownPortError(nodeId, outputName, false);
    }
    if (!value.is(port->type)) {
        throw TypeMismatchError(valueTypeToString(port->type), valueTypeToString(value.getType()));
    }
    return cache.store(port->id, value);
}

} // namespace nodes
