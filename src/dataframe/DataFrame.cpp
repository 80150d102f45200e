#include "DataFrame.hpp"
#include "DataFrameSerializer.hpp"
#include <stdexcept>

namespace dataframe {

// ============================================================================
// Construction
// ============================================================================

void DataFrame::addColumn(IColumnPtr column) {
    if (!column) {
        throw std::invalid_argument("Cannot add null column");
    }

    const auto& name = column->getName();
    if (m_columns.find(name) != m_columns.end()) {
        throw std::invalid_argument("Column '" + name + "' already exists");
    }

    if (!m_columnOrder.empty() && column->size() != rowCount()) {
        throw std::invalid_argument(
            "Column '" + name + "' has " + std::to_string(column->size()) +
            " rows, expected " + std::to_string(rowCount()));
    }

    m_columns[name] = column;
    m_columnOrder.push_back(name);
}

// A column added to a populated frame starts as all nulls
static void padWithNulls(IColumn& column, size_t rows) {
    column.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        column.pushNull();
    }
}

void DataFrame::addIntColumn(const std::string& name) {
    auto col = std::make_shared<IntColumn>(name);
    padWithNulls(*col, rowCount());
    addColumn(col);
}

void DataFrame::addDoubleColumn(const std::string& name) {
    auto col = std::make_shared<DoubleColumn>(name);
    padWithNulls(*col, rowCount());
    addColumn(col);
}

void DataFrame::addStringColumn(const std::string& name) {
    auto col = std::make_shared<StringColumn>(name);
    padWithNulls(*col, rowCount());
    addColumn(col);
}

void DataFrame::addRow(const std::vector<std::string>& values) {
    if (values.size() != m_columnOrder.size()) {
        throw std::invalid_argument("Row size mismatch");
    }

    for (size_t i = 0; i < values.size(); ++i) {
        const auto& colName = m_columnOrder[i];
        auto col = m_columns[colName];

        if (values[i].empty()) {
            col->pushNull();
        } else if (auto intCol = std::dynamic_pointer_cast<IntColumn>(col)) {
            intCol->push_back(static_cast<int64_t>(std::stoll(values[i])));
        } else if (auto doubleCol = std::dynamic_pointer_cast<DoubleColumn>(col)) {
            doubleCol->push_back(std::stod(values[i]));
        } else if (auto stringCol = std::dynamic_pointer_cast<StringColumn>(col)) {
            stringCol->push_back(values[i]);
        }
    }
}

// ============================================================================
// Accessors
// ============================================================================

IColumnPtr DataFrame::getColumn(const std::string& name) const {
    auto it = m_columns.find(name);
    if (it == m_columns.end()) {
        return nullptr;
    }
    return it->second;
}

bool DataFrame::hasColumn(const std::string& name) const {
    return m_columns.find(name) != m_columns.end();
}

size_t DataFrame::rowCount() const {
    if (m_columnOrder.empty()) {
        return 0;
    }
    return m_columns.at(m_columnOrder.front())->size();
}

bool DataFrame::empty() const {
    return m_columnOrder.empty() || rowCount() == 0;
}

std::string DataFrame::toString(size_t maxRows) const {
    return DataFrameSerializer::toString(*this, maxRows);
}

} // namespace dataframe
