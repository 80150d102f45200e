#include "CsvNodes.hpp"
#include "nodes/NodeBuilder.hpp"
#include "nodes/NodeContext.hpp"
#include "nodes/NodeRegistry.hpp"
#include "nodes/Errors.hpp"
#include "dataframe/DataFrame.hpp"
#include "dataframe/DataFrameIO.hpp"

namespace nodes {

void registerCsvNodes(NodeRegistry& registry) {
    registerLoadCsvNode(registry);
    registerCountRowsNode(registry);
}

void registerLoadCsvNode(NodeRegistry& registry) {
    NodeBuilder("load_csv", "Table")
        .category("Scalar")
        .label("Load CSV")
        .input("path", Type::Text)
        .output("out", Type::Frame)
        .onCompile([](NodeContext& ctx) {
            std::string path = ctx.getText("path");

            std::shared_ptr<dataframe::DataFrame> df;
            try {
                df = dataframe::DataFrameIO::readCSV(path);
            } catch (const dataframe::CsvReadError& e) {
                throw FileReadError(e.what());
            } catch (const dataframe::CsvParseError& e) {
                throw ParseError(path + ": " + e.what());
            }

            ctx.setOutput("out", df);
        })
        .buildAndRegister(registry);
}

void registerCountRowsNode(NodeRegistry& registry) {
    NodeBuilder("count_rows", "Table")
        .category("Scalar")
        .label("Count rows")
        .input("df", Type::Frame)
        .output("out", Type::Scalar)
        .onCompile([](NodeContext& ctx) {
            auto df = ctx.getFrame("df");
            ctx.setOutput("out", static_cast<double>(df->rowCount()));
        })
        .buildAndRegister(registry);
}

} // namespace nodes
