#include "nodes/Errors.hpp"

namespace nodes {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TypeMismatch:           return "TypeMismatch";
        case ErrorKind::UnknownPort:            return "UnknownPort";
        case ErrorKind::UnknownNode:            return "UnknownNode";
        case ErrorKind::UnknownKind:            return "UnknownKind";
        case ErrorKind::FileReadFailure:        return "FileReadFailure";
        case ErrorKind::ParseFailure:           return "ParseFailure";
        case ErrorKind::CacheInvariantViolated: return "CacheInvariantViolated";
        case ErrorKind::CycleDetected:          return "CycleDetected";
    }
    return "Unknown";
}

} // namespace nodes
