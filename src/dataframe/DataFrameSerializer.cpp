#include "DataFrameSerializer.hpp"
#include "DataFrame.hpp"
#include <sstream>
#include <algorithm>
#include <stdexcept>

namespace dataframe {

std::string DataFrameSerializer::toString(const DataFrame& df, size_t maxRows) {
    std::ostringstream oss;
    auto columnOrder = df.getColumnNames();

    if (columnOrder.empty()) {
        oss << "Empty DataFrame\n";
        return oss.str();
    }

    // Headers
    for (const auto& colName : columnOrder) {
        oss << colName << "\t";
    }
    oss << "\n";

    // Rows
    size_t rowCount = df.rowCount();
    size_t displayRows = std::min(rowCount, maxRows);
    for (size_t i = 0; i < displayRows; ++i) {
        for (const auto& colName : columnOrder) {
            auto col = df.getColumn(colName);
            oss << (col->isNull(i) ? "null" : col->toString(i)) << "\t";
        }
        oss << "\n";
    }

    if (rowCount > maxRows) {
        oss << "... (" << (rowCount - maxRows) << " more rows)\n";
    }

    return oss.str();
}

json DataFrameSerializer::cellToJson(const IColumn& column, size_t row) {
    if (column.isNull(row)) {
        return nullptr;
    }
    switch (column.getType()) {
        case ColumnType::INT:
            return static_cast<const IntColumn&>(column).at(row);
        case ColumnType::DOUBLE:
            return static_cast<const DoubleColumn&>(column).at(row);
        case ColumnType::STRING:
            return static_cast<const StringColumn&>(column).at(row);
    }
    return nullptr;
}

void DataFrameSerializer::appendCell(IColumn& column, const json& cell) {
    if (cell.is_null()) {
        column.pushNull();
        return;
    }
    switch (column.getType()) {
        case ColumnType::INT:
            static_cast<IntColumn&>(column).push_back(cell.get<int64_t>());
            break;
        case ColumnType::DOUBLE:
            static_cast<DoubleColumn&>(column).push_back(cell.get<double>());
            break;
        case ColumnType::STRING:
            if (cell.is_string()) {
                static_cast<StringColumn&>(column).push_back(cell.get<std::string>());
            } else {
                static_cast<StringColumn&>(column).push_back(cell.dump());
            }
            break;
    }
}

IColumnPtr DataFrameSerializer::makeColumn(const std::string& name, ColumnType type) {
    switch (type) {
        case ColumnType::INT:    return std::make_shared<IntColumn>(name);
        case ColumnType::DOUBLE: return std::make_shared<DoubleColumn>(name);
        case ColumnType::STRING: return std::make_shared<StringColumn>(name);
    }
    return std::make_shared<StringColumn>(name);
}

ColumnType DataFrameSerializer::stringToColumnType(const std::string& typeStr) {
    if (typeStr == "INT") return ColumnType::INT;
    if (typeStr == "DOUBLE") return ColumnType::DOUBLE;
    return ColumnType::STRING;
}

json DataFrameSerializer::toJson(const DataFrame& df) {
    auto columnOrder = df.getColumnNames();

    json result = json::object();
    result["columns"] = columnOrder;

    // Build schema with column types
    json schema = json::array();
    for (const auto& colName : columnOrder) {
        json colSchema = json::object();
        colSchema["name"] = colName;
        colSchema["type"] = columnTypeToString(df.getColumn(colName)->getType());
        schema.push_back(colSchema);
    }
    result["schema"] = schema;

    // Build data array
    json data = json::array();
    for (size_t i = 0; i < df.rowCount(); ++i) {
        json row = json::array();
        for (const auto& colName : columnOrder) {
            row.push_back(cellToJson(*df.getColumn(colName), i));
        }
        data.push_back(row);
    }
    result["data"] = data;

    return result;
}

DataFramePtr DataFrameSerializer::fromJson(const json& j) {
    if (!j.is_object() || !j.contains("columns") || !j["columns"].is_array()) {
        throw std::invalid_argument("Invalid frame JSON: missing 'columns' array");
    }

    std::vector<std::string> columnNames = j["columns"].get<std::vector<std::string>>();

    // Column types from schema, STRING when absent
    std::vector<ColumnType> types(columnNames.size(), ColumnType::STRING);
    if (j.contains("schema") && j["schema"].is_array()) {
        for (const auto& colSchema : j["schema"]) {
            auto name = colSchema.value("name", "");
            auto it = std::find(columnNames.begin(), columnNames.end(), name);
            if (it != columnNames.end()) {
                types[it - columnNames.begin()] = stringToColumnType(colSchema.value("type", "STRING"));
            }
        }
    }

    std::vector<IColumnPtr> columns;
    for (size_t i = 0; i < columnNames.size(); ++i) {
        columns.push_back(makeColumn(columnNames[i], types[i]));
    }

    if (j.contains("data") && j["data"].is_array()) {
        for (const auto& row : j["data"]) {
            if (!row.is_array() || row.size() != columns.size()) {
                throw std::invalid_argument("Invalid frame JSON: row size mismatch");
            }
            for (size_t i = 0; i < columns.size(); ++i) {
                appendCell(*columns[i], row[i]);
            }
        }
    }

    auto df = std::make_shared<DataFrame>();
    for (auto& col : columns) {
        df->addColumn(col);
    }
    return df;
}

json DataFrameSerializer::columnToJson(const IColumn& column) {
    json result = json::object();
    result["name"] = column.getName();
    result["dtype"] = columnTypeToString(column.getType());

    json data = json::array();
    for (size_t i = 0; i < column.size(); ++i) {
        data.push_back(cellToJson(column, i));
    }
    result["data"] = data;
    return result;
}

IColumnPtr DataFrameSerializer::columnFromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Invalid series JSON: expected an object");
    }

    auto col = makeColumn(j.value("name", "empty"),
                          stringToColumnType(j.value("dtype", "DOUBLE")));

    if (j.contains("data") && j["data"].is_array()) {
        for (const auto& cell : j["data"]) {
            appendCell(*col, cell);
        }
    }
    return col;
}

} // namespace dataframe
