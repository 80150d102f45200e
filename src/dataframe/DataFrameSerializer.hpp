#pragma once

#include "Column.hpp"
#include <nlohmann/json.hpp>
#include <vector>
#include <string>
#include <memory>

namespace dataframe {

class DataFrame;
using DataFramePtr = std::shared_ptr<DataFrame>;

using json = nlohmann::json;

/**
 * Rendering of frames and columns: text tables for the console,
 * JSON for graph documents and results. Nulls map to JSON null.
 */
class DataFrameSerializer {
public:
    static std::string toString(const DataFrame& df, size_t maxRows = 10);

    /**
     * Frame with schema:
     * {
     *   "columns": ["col1", "col2"],
     *   "schema": [{"name": "col1", "type": "INT"}, {"name": "col2", "type": "STRING"}],
     *   "data": [[1, "hello"], [null, "world"]]
     * }
     */
    static json toJson(const DataFrame& df);

    /**
     * Rebuild a frame from toJson() output. Missing schema entries default to STRING.
     */
    static DataFramePtr fromJson(const json& j);

    /**
     * Single column: {"name": "x", "dtype": "DOUBLE", "data": [1.5, null]}
     */
    static json columnToJson(const IColumn& column);
    static IColumnPtr columnFromJson(const json& j);

    static ColumnType stringToColumnType(const std::string& typeStr);

private:
    static json cellToJson(const IColumn& column, size_t row);
    static void appendCell(IColumn& column, const json& cell);
    static IColumnPtr makeColumn(const std::string& name, ColumnType type);
};

} // namespace dataframe
