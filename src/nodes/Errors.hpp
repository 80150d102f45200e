#pragma once

#include <stdexcept>
#include <string>

namespace nodes {

/**
 * Failure categories surfaced by graph evaluation
 */
enum class ErrorKind {
    TypeMismatch,            // Value downcast against a different tag
    UnknownPort,             // Named input/output missing on the node
    UnknownNode,             // Node id not in the graph
    UnknownKind,             // Node kind has no registered definition
    FileReadFailure,         // load_csv could not read the file
    ParseFailure,            // load_csv could not parse the file
    CacheInvariantViolated,  // Internal: an output was not populated
    CycleDetected            // Node reached again while being evaluated
};

std::string errorKindToString(ErrorKind kind);

/**
 * Base class for every evaluation failure.
 *
 * The executor records the id of the node whose computation raised
 * the error the first time it crosses a node boundary.
 */
class EvalError : public std::runtime_error {
public:
    EvalError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    const std::string& nodeId() const { return m_nodeId; }
    void setNodeId(const std::string& nodeId) { m_nodeId = nodeId; }

private:
    ErrorKind m_kind;
    std::string m_nodeId;
};

class TypeMismatchError : public EvalError {
public:
    TypeMismatchError(const std::string& expected, const std::string& actual)
        : EvalError(ErrorKind::TypeMismatch,
                    "Invalid cast from " + actual + " to " + expected)
        , m_expected(expected)
        , m_actual(actual) {}

    const std::string& expected() const { return m_expected; }
    const std::string& actual() const { return m_actual; }

private:
    std::string m_expected;
    std::string m_actual;
};

class UnknownPortError : public EvalError {
public:
    UnknownPortError(const std::string& nodeId, const std::string& portName, bool isInput)
        : EvalError(ErrorKind::UnknownPort,
                    "Node '" + nodeId + "' has no " + (isInput ? "input" : "output") +
                    " named '" + portName + "'") {}
};

class UnknownNodeError : public EvalError {
public:
    explicit UnknownNodeError(const std::string& nodeId)
        : EvalError(ErrorKind::UnknownNode, "Node not found: " + nodeId) {}
};

class UnknownKindError : public EvalError {
public:
    explicit UnknownKindError(const std::string& kind)
        : EvalError(ErrorKind::UnknownKind, "Node definition not found: " + kind) {}
};

class FileReadError : public EvalError {
public:
    explicit FileReadError(const std::string& message)
        : EvalError(ErrorKind::FileReadFailure, message) {}
};

class ParseError : public EvalError {
public:
    explicit ParseError(const std::string& message)
        : EvalError(ErrorKind::ParseFailure, message) {}
};

class CacheInvariantError : public EvalError {
public:
    explicit CacheInvariantError(const std::string& message)
        : EvalError(ErrorKind::CacheInvariantViolated, message) {}
};

class CycleError : public EvalError {
public:
    explicit CycleError(const std::string& nodeId)
        : EvalError(ErrorKind::CycleDetected, "Cycle detected in node graph at " + nodeId) {}
};

} // namespace nodes
