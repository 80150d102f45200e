#include "Commands.hpp"
#include "nodes/NodeGraphSerializer.hpp"
#include "dataframe/DataFrame.hpp"
#include <sstream>

namespace flowgraph {
namespace app {

using nlohmann::json;

std::string formatValue(const nodes::Value& value, size_t maxRows) {
    std::ostringstream oss;
    switch (value.getType()) {
        case nodes::ValueType::Scalar:
            oss << value.getScalar();
            break;
        case nodes::ValueType::Vector: {
            auto v = value.getVector();
            oss << "(" << v.x << ", " << v.y << ")";
            break;
        }
        case nodes::ValueType::Text:
            oss << "\"" << value.getText() << "\"";
            break;
        case nodes::ValueType::Series: {
            // Shown as a one-column table
            dataframe::DataFrame view;
            view.addColumn(value.getSeries());
            oss << "\n" << view.toString(maxRows);
            break;
        }
        case nodes::ValueType::Frame:
            oss << "\n" << value.getFrame()->toString(maxRows);
            break;
    }
    return oss.str();
}

json resultToJson(const nodes::NodeResult& result, const std::string& kind) {
    json j;
    j["node_id"] = result.nodeId;
    j["kind"] = kind;
    if (result.hasError) {
        json err;
        err["kind"] = result.errorKind ? nodes::errorKindToString(*result.errorKind) : "Internal";
        err["message"] = result.errorMessage;
        err["node_id"] = result.failedNodeId;
        j["error"] = err;
    } else {
        j["value"] = nodes::NodeGraphSerializer::valueToJson(result.value);
    }
    return j;
}

void listNodes(const nodes::NodeRegistry& registry, const std::string& format, std::ostream& out) {
    if (format == "json") {
        json list = json::array();
        for (const auto& name : registry.getNodeNames()) {
            auto def = registry.getNode(name);
            json entry;
            entry["name"] = name;
            entry["label"] = def->getLabel();
            entry["categories"] = def->getCategories();
            json inputs = json::array();
            for (const auto& input : def->getInputs()) {
                inputs.push_back({{"name", input.name}, {"type", nodes::valueTypeToString(input.type)}});
            }
            entry["inputs"] = inputs;
            json outputs = json::array();
            for (const auto& output : def->getOutputs()) {
                outputs.push_back({{"name", output.name}, {"type", nodes::valueTypeToString(output.type)}});
            }
            entry["outputs"] = outputs;
            list.push_back(entry);
        }
        out << list.dump(2) << std::endl;
        return;
    }

    for (const auto& name : registry.getNodeNames()) {
        auto def = registry.getNode(name);
        out << name << "\t" << def->getLabel() << "\t";
        const auto& categories = def->getCategories();
        for (size_t i = 0; i < categories.size(); ++i) {
            out << (i > 0 ? ", " : "") << categories[i];
        }
        out << std::endl;
    }
}

int runGraph(const AppConfig& config, const nodes::NodeRegistry& registry,
             std::ostream& out, std::ostream& events) {
    nodes::NodeGraph graph = nodes::NodeGraphSerializer::fromFile(config.graphPath, registry);
    LOG_INFO("Loaded " + config.graphPath + ": " + std::to_string(graph.nodeCount()) + " nodes, " +
             std::to_string(graph.getConnections().size()) + " connections");

    std::vector<std::string> targets;
    if (config.nodeId) {
        targets.push_back(*config.nodeId);
    } else {
        targets = graph.getNodeIds();
    }

    nodes::NodeExecutor executor(registry);
    if (config.printEvents) {
        executor.setExecutionCallback([&events](const nodes::ExecutionEvent& evt) {
            events << evt.toJson().dump() << std::endl;
        });
    }

    size_t failures = 0;
    json results = json::array();
    for (const auto& nodeId : targets) {
        auto result = executor.evaluate(graph, nodeId);
        const auto* node = graph.getNode(nodeId);
        std::string kind = node ? node->kind : "";

        if (result.hasError) {
            ++failures;
        }

        if (config.format == "json") {
            results.push_back(resultToJson(result, kind));
        } else if (result.hasError) {
            out << nodeId << " (" << kind << "): Execution error: " << result.errorMessage;
            if (!result.failedNodeId.empty() && result.failedNodeId != nodeId) {
                out << " [at " << result.failedNodeId << "]";
            }
            out << std::endl;
        } else {
            out << nodeId << " (" << kind << "): The result is: "
                << formatValue(result.value, config.maxRows) << std::endl;
        }
    }

    if (config.format == "json") {
        out << results.dump(2) << std::endl;
    }

    LOG_INFO("Evaluated " + std::to_string(targets.size()) + " nodes, " +
             std::to_string(failures) + " failed");
    return failures == 0 ? 0 : 1;
}

} // namespace app
} // namespace flowgraph
