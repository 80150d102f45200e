#include "SelectNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeContext.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/Errors.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/Column.hpp"

namespace nodes {

void registerSelectNodes(NodeRegistry& registry) {
    registerSelectColumnNode(registry);
    registerSimpleFilterNode(registry);
}

void registerSelectColumnNode(NodeRegistry& registry) {
    NodeBuilder("select_column", "Table")
        .category("Scalar")
        .label("Select column")
        .input("df", Type::Frame)
        .input("column", Type::Text)
        .output("out", Type::Series)
        .onCompile([](NodeContext& ctx) {
            auto df = ctx.getFrame("df");
            std::string columnName = ctx.getText("column");

            // Missing column is not an error
            auto column = df->getColumn(columnName);
            if (!column) {
                ctx.setOutput("out", Value::emptySeries());
                return;
            }
            ctx.setOutput("out", column->clone());
        })
        .buildAndRegister(registry);
}

void registerSimpleFilterNode(NodeRegistry& registry) {
    NodeBuilder("simple_filter", "Table")
        .category("Scalar")
        .label("Simple filter")
        .input("df", Type::Series)
        .input("min", Type::Scalar)
        .input("max", Type::Scalar)
        .output("out", Type::Series)
        .onCompile([](NodeContext& ctx) {
            auto series = ctx.getSeries("df");
            double min = ctx.getScalar("min");
            double max = ctx.getScalar("max");

            if (!series->isNumeric()) {
                throw TypeMismatchError("numeric series",
                                        dataframe::columnTypeToString(series->getType()) + " series");
            }

            auto indices = series->filterBetween(min, max);
            ctx.setOutput("out", series->filterByIndices(indices));
        })
        .buildAndRegister(registry);
}

} // namespace nodes
