#pragma once

#include "nodes/Types.hpp"
#include "nodes/NodeGraph.hpp"
#include <unordered_map>

namespace nodes {

/**
 * Values computed during one evaluation request, keyed by output port.
 * Created empty per request and discarded afterwards.
 */
class OutputCache {
public:
    bool contains(PortId port) const { return m_values.count(port) > 0; }

    /**
     * Returns nullptr if the port has not been populated
     */
    const Value* find(PortId port) const;

    /**
     * Store a value for a port that has not been populated yet.
     * Throws CacheInvariantError if the port already holds a value.
     */
    const Value& store(PortId port, Value value);

    /**
     * Drop a port's value. Returns false if it was not populated.
     */
    bool erase(PortId port) { return m_values.erase(port) > 0; }

    size_t size() const { return m_values.size(); }
    bool empty() const { return m_values.empty(); }
    void clear() { m_values.clear(); }

private:
    std::unordered_map<PortId, Value> m_values;
};

} // namespace nodes
