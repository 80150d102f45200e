#include "nodes/Types.hpp"
#include "nodes/Errors.hpp"
#include <sstream>
#include <stdexcept>

namespace nodes {

// === Free functions ===

std::string valueTypeToString(ValueType type) {
    switch (type) {
        case ValueType::Scalar: return "scalar";
        case ValueType::Vector: return "vector";
        case ValueType::Text:   return "text";
        case ValueType::Series: return "series";
        case ValueType::Frame:  return "frame";
    }
    return "unknown";
}

ValueType stringToValueType(const std::string& str) {
    if (str == "scalar") return ValueType::Scalar;
    if (str == "vector") return ValueType::Vector;
    if (str == "text")   return ValueType::Text;
    if (str == "series") return ValueType::Series;
    if (str == "frame")  return ValueType::Frame;
    throw std::invalid_argument("Unknown value type: " + str);
}

// === Value ===

Value::Value()
    : m_value(0.0) {}

Value::Value(double value)
    : m_value(value) {}

Value::Value(Vec2 value)
    : m_value(value) {}

Value::Value(const std::string& value)
    : m_value(value) {}

Value::Value(const char* value)
    : m_value(std::string(value)) {}

Value::Value(dataframe::IColumnPtr series)
    : m_value(std::move(series)) {
    if (!std::get<dataframe::IColumnPtr>(m_value)) {
        throw std::invalid_argument("Series value requires a column");
    }
}

Value::Value(std::shared_ptr<dataframe::DataFrame> frame)
    : m_value(std::move(frame)) {
    if (!std::get<std::shared_ptr<dataframe::DataFrame>>(m_value)) {
        throw std::invalid_argument("Frame value requires a DataFrame");
    }
}

double Value::getScalar() const {
    if (auto* v = std::get_if<double>(&m_value)) {
        return *v;
    }
    throw TypeMismatchError(valueTypeToString(ValueType::Scalar), valueTypeToString(getType()));
}

Vec2 Value::getVector() const {
    if (auto* v = std::get_if<Vec2>(&m_value)) {
        return *v;
    }
    throw TypeMismatchError(valueTypeToString(ValueType::Vector), valueTypeToString(getType()));
}

const std::string& Value::getText() const {
    if (auto* v = std::get_if<std::string>(&m_value)) {
        return *v;
    }
    throw TypeMismatchError(valueTypeToString(ValueType::Text), valueTypeToString(getType()));
}

dataframe::IColumnPtr Value::getSeries() const {
    if (auto* v = std::get_if<dataframe::IColumnPtr>(&m_value)) {
        return *v;
    }
    throw TypeMismatchError(valueTypeToString(ValueType::Series), valueTypeToString(getType()));
}

std::shared_ptr<dataframe::DataFrame> Value::getFrame() const {
    if (auto* v = std::get_if<std::shared_ptr<dataframe::DataFrame>>(&m_value)) {
        return *v;
    }
    throw TypeMismatchError(valueTypeToString(ValueType::Frame), valueTypeToString(getType()));
}

std::string Value::describe() const {
    std::ostringstream oss;
    switch (getType()) {
        case ValueType::Scalar:
            oss << "scalar(" << std::get<double>(m_value) << ")";
            break;
        case ValueType::Vector: {
            const auto& v = std::get<Vec2>(m_value);
            oss << "vector(" << v.x << ", " << v.y << ")";
            break;
        }
        case ValueType::Text:
            oss << "text(\"" << std::get<std::string>(m_value) << "\")";
            break;
        case ValueType::Series: {
            const auto& col = std::get<dataframe::IColumnPtr>(m_value);
            oss << "series(\"" << col->getName() << "\", " << col->size() << " rows)";
            break;
        }
        case ValueType::Frame: {
            const auto& df = std::get<std::shared_ptr<dataframe::DataFrame>>(m_value);
            oss << "frame(" << df->rowCount() << "x" << df->columnCount() << ")";
            break;
        }
    }
    return oss.str();
}

Value Value::emptySeries(const std::string& name) {
    return Value(std::make_shared<dataframe::DoubleColumn>(name));
}

Value Value::emptyFrame() {
    return Value(std::make_shared<dataframe::DataFrame>());
}

Value defaultValueFor(ValueType type) {
    switch (type) {
        case ValueType::Scalar: return Value(0.0);
        case ValueType::Vector: return Value(Vec2{0.0, 0.0});
        case ValueType::Text:   return Value(std::string());
        case ValueType::Series: return Value::emptySeries();
        case ValueType::Frame:  return Value::emptyFrame();
    }
    return Value();
}

} // namespace nodes
