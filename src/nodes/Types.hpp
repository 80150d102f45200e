#pragma once

#include "dataframe/DataFrame.hpp"
#include <variant>
#include <string>
#include <memory>

namespace nodes {

/**
 * Port data types.
 *
 * - Scalar: double
 * - Vector: 2D vector of doubles
 * - Text:   string (file paths, column names)
 * - Series: one nullable column
 * - Frame:  table of equal-length named columns
 */
enum class ValueType {
    Scalar,
    Vector,
    Text,
    Series,
    Frame
};

/**
 * Convert ValueType to string for display/serialization
 */
std::string valueTypeToString(ValueType type);

/**
 * Convert string to ValueType
 */
ValueType stringToValueType(const std::string& str);

/**
 * 2D vector with componentwise arithmetic
 */
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2 operator+(const Vec2& other) const { return {x + other.x, y + other.y}; }
    Vec2 operator-(const Vec2& other) const { return {x - other.x, y - other.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }
    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }
};

/**
 * Value storage; alternative index follows ValueType order
 */
using NodeValue = std::variant<
    double,                                  // Scalar
    Vec2,                                    // Vector
    std::string,                             // Text
    dataframe::IColumnPtr,                   // Series
    std::shared_ptr<dataframe::DataFrame>    // Frame
>;

/**
 * Runtime value flowing through ports.
 *
 * No implicit coercion: each getter throws TypeMismatchError unless the
 * value carries exactly that tag. Series and frames are shared, never
 * mutated after construction.
 */
class Value {
public:
    // Default constructor - Scalar 0.0
    Value();

    // Type-specific constructors
    Value(double value);
    Value(Vec2 value);
    Value(const std::string& value);
    Value(const char* value);
    Value(dataframe::IColumnPtr series);
    Value(std::shared_ptr<dataframe::DataFrame> frame);

    // Getters
    ValueType getType() const { return static_cast<ValueType>(m_value.index()); }
    const NodeValue& getValue() const { return m_value; }

    // Fallible narrowing (throws TypeMismatchError on wrong tag)
    double getScalar() const;
    Vec2 getVector() const;
    const std::string& getText() const;
    dataframe::IColumnPtr getSeries() const;
    std::shared_ptr<dataframe::DataFrame> getFrame() const;

    bool is(ValueType type) const { return getType() == type; }

    /**
     * Short human-readable form, e.g. "scalar(15)" or "frame(7x3)"
     */
    std::string describe() const;

    /**
     * Empty double series, the default constant of series inputs
     */
    static Value emptySeries(const std::string& name = "empty");

    /**
     * Frame without columns, the default constant of frame inputs
     */
    static Value emptyFrame();

private:
    NodeValue m_value;
};

/**
 * Constant held by an unconnected input of the given type:
 * 0.0, (0, 0), "", empty series named "empty", empty frame
 */
Value defaultValueFor(ValueType type);

} // namespace nodes
