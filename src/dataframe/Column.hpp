#pragma once

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <algorithm>
#include <sstream>

namespace dataframe {

enum class ColumnType {
    INT,
    DOUBLE,
    STRING
};

/**
 * Base interface for nullable typed columns.
 * A column is also the payload of a Series value.
 */
class IColumn {
public:
    virtual ~IColumn() = default;

    virtual const std::string& getName() const = 0;
    virtual void setName(const std::string& name) = 0;
    virtual ColumnType getType() const = 0;
    virtual size_t size() const = 0;
    virtual void reserve(size_t capacity) = 0;

    // Null handling
    virtual void pushNull() = 0;
    virtual bool isNull(size_t index) const = 0;
    size_t nullCount() const {
        size_t count = 0;
        for (size_t i = 0; i < size(); ++i) {
            if (isNull(i)) ++count;
        }
        return count;
    }

    // Numeric view: nullopt for a null cell. Only valid when isNumeric().
    virtual bool isNumeric() const = 0;
    virtual std::optional<double> numericAt(size_t index) const = 0;

    // Display form of a cell, empty for null
    virtual std::string toString(size_t index) const = 0;

    // Indices of non-null rows with min <= value <= max
    virtual std::vector<size_t> filterBetween(double min, double max) const = 0;

    virtual std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const = 0;

    virtual std::shared_ptr<IColumn> clone() const = 0;
};

using IColumnPtr = std::shared_ptr<IColumn>;

/**
 * Contiguous int64 column with a null mask
 */
class IntColumn : public IColumn {
public:
    explicit IntColumn(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    void setName(const std::string& name) override { m_name = name; }
    ColumnType getType() const override { return ColumnType::INT; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override {
        m_data.reserve(capacity);
        m_null.reserve(capacity);
    }

    void push_back(int64_t value) {
        m_data.push_back(value);
        m_null.push_back(false);
    }

    void pushNull() override {
        m_data.push_back(0);
        m_null.push_back(true);
    }

    bool isNull(size_t index) const override { return m_null[index]; }
    int64_t at(size_t index) const { return m_data[index]; }
    const std::vector<int64_t>& data() const { return m_data; }

    bool isNumeric() const override { return true; }

    std::optional<double> numericAt(size_t index) const override {
        if (m_null[index]) return std::nullopt;
        return static_cast<double>(m_data[index]);
    }

    std::string toString(size_t index) const override {
        return m_null[index] ? std::string() : std::to_string(m_data[index]);
    }

    std::vector<size_t> filterBetween(double min, double max) const override {
        std::vector<size_t> result;
        result.reserve(m_data.size() / 2);

        for (size_t i = 0; i < m_data.size(); ++i) {
            if (m_null[i]) continue;
            double v = static_cast<double>(m_data[i]);
            if (v >= min && v <= max) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<IntColumn>(m_name);
        newCol->reserve(indices.size());
        for (size_t idx : indices) {
            if (idx >= m_data.size()) continue;
            if (m_null[idx]) {
                newCol->pushNull();
            } else {
                newCol->push_back(m_data[idx]);
            }
        }
        return newCol;
    }

    std::shared_ptr<IColumn> clone() const override {
        auto newCol = std::make_shared<IntColumn>(m_name);
        newCol->m_data = m_data;
        newCol->m_null = m_null;
        return newCol;
    }

private:
    std::string m_name;
    std::vector<int64_t> m_data;
    std::vector<bool> m_null;
};

/**
 * Contiguous double column with a null mask
 */
class DoubleColumn : public IColumn {
public:
    explicit DoubleColumn(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    void setName(const std::string& name) override { m_name = name; }
    ColumnType getType() const override { return ColumnType::DOUBLE; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override {
        m_data.reserve(capacity);
        m_null.reserve(capacity);
    }

    void push_back(double value) {
        m_data.push_back(value);
        m_null.push_back(false);
    }

    void push_back(std::optional<double> value) {
        if (value) {
            push_back(*value);
        } else {
            pushNull();
        }
    }

    void pushNull() override {
        m_data.push_back(0.0);
        m_null.push_back(true);
    }

    bool isNull(size_t index) const override { return m_null[index]; }
    double at(size_t index) const { return m_data[index]; }
    const std::vector<double>& data() const { return m_data; }

    bool isNumeric() const override { return true; }

    std::optional<double> numericAt(size_t index) const override {
        if (m_null[index]) return std::nullopt;
        return m_data[index];
    }

    std::string toString(size_t index) const override {
        if (m_null[index]) return std::string();
        std::ostringstream oss;
        oss << m_data[index];
        return oss.str();
    }

    std::vector<size_t> filterBetween(double min, double max) const override {
        std::vector<size_t> result;
        result.reserve(m_data.size() / 2);

        for (size_t i = 0; i < m_data.size(); ++i) {
            if (m_null[i]) continue;
            if (m_data[i] >= min && m_data[i] <= max) {
                result.push_back(i);
            }
        }
        return result;
    }

    std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<DoubleColumn>(m_name);
        newCol->reserve(indices.size());
        for (size_t idx : indices) {
            if (idx >= m_data.size()) continue;
            if (m_null[idx]) {
                newCol->pushNull();
            } else {
                newCol->push_back(m_data[idx]);
            }
        }
        return newCol;
    }

    std::shared_ptr<IColumn> clone() const override {
        auto newCol = std::make_shared<DoubleColumn>(m_name);
        newCol->m_data = m_data;
        newCol->m_null = m_null;
        return newCol;
    }

private:
    std::string m_name;
    std::vector<double> m_data;
    std::vector<bool> m_null;
};

/**
 * Text column. Not numeric: range filtering does not apply.
 */
class StringColumn : public IColumn {
public:
    explicit StringColumn(const std::string& name) : m_name(name) {}

    const std::string& getName() const override { return m_name; }
    void setName(const std::string& name) override { m_name = name; }
    ColumnType getType() const override { return ColumnType::STRING; }
    size_t size() const override { return m_data.size(); }

    void reserve(size_t capacity) override {
        m_data.reserve(capacity);
        m_null.reserve(capacity);
    }

    void push_back(const std::string& value) {
        m_data.push_back(value);
        m_null.push_back(false);
    }

    void pushNull() override {
        m_data.emplace_back();
        m_null.push_back(true);
    }

    bool isNull(size_t index) const override { return m_null[index]; }
    const std::string& at(size_t index) const { return m_data[index]; }
    const std::vector<std::string>& data() const { return m_data; }

    bool isNumeric() const override { return false; }

    std::optional<double> numericAt(size_t) const override {
        return std::nullopt;  // Not applicable
    }

    std::string toString(size_t index) const override {
        return m_null[index] ? std::string() : m_data[index];
    }

    std::vector<size_t> filterBetween(double, double) const override {
        return {};  // Not applicable
    }

    std::shared_ptr<IColumn> filterByIndices(const std::vector<size_t>& indices) const override {
        auto newCol = std::make_shared<StringColumn>(m_name);
        newCol->reserve(indices.size());
        for (size_t idx : indices) {
            if (idx >= m_data.size()) continue;
            if (m_null[idx]) {
                newCol->pushNull();
            } else {
                newCol->push_back(m_data[idx]);
            }
        }
        return newCol;
    }

    std::shared_ptr<IColumn> clone() const override {
        auto newCol = std::make_shared<StringColumn>(m_name);
        newCol->m_data = m_data;
        newCol->m_null = m_null;
        return newCol;
    }

private:
    std::string m_name;
    std::vector<std::string> m_data;
    std::vector<bool> m_null;
};

/**
 * Convert ColumnType to string ("INT", "DOUBLE", "STRING")
 */
inline std::string columnTypeToString(ColumnType type) {
    switch (type) {
        case ColumnType::INT:    return "INT";
        case ColumnType::DOUBLE: return "DOUBLE";
        case ColumnType::STRING: return "STRING";
    }
    return "STRING";
}

} // namespace dataframe
