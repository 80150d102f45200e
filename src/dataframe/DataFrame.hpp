#pragma once

#include "Column.hpp"
#include <unordered_map>
#include <vector>
#include <string>
#include <memory>

namespace dataframe {

/**
 * Ordered collection of named, equal-length columns.
 *
 * Invariants:
 * - column names are unique
 * - every column has rowCount() rows
 *
 * Frames are treated as immutable once handed to the node graph;
 * operations return new frames or cloned columns.
 */
class DataFrame {
public:
    DataFrame() = default;

    // Construction
    void addColumn(IColumnPtr column);
    void addIntColumn(const std::string& name);
    void addDoubleColumn(const std::string& name);
    void addStringColumn(const std::string& name);

    // Appends one row; empty strings become nulls
    void addRow(const std::vector<std::string>& values);

    // Accessors
    IColumnPtr getColumn(const std::string& name) const;
    bool hasColumn(const std::string& name) const;
    std::vector<std::string> getColumnNames() const { return m_columnOrder; }
    size_t rowCount() const;
    size_t columnCount() const { return m_columnOrder.size(); }
    bool empty() const;

    // Utilities (delegate to the serializer)
    std::string toString(size_t maxRows = 10) const;

private:
    std::unordered_map<std::string, IColumnPtr> m_columns;
    std::vector<std::string> m_columnOrder;
};

using DataFramePtr = std::shared_ptr<DataFrame>;

} // namespace dataframe
