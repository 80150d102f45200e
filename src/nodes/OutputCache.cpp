#include "nodes/OutputCache.hpp"
#include "nodes/Errors.hpp"

namespace nodes {

const Value* OutputCache::find(PortId port) const {
    auto it = m_values.find(port);
    return it != m_values.end() ? &it->second : nullptr;
}

const Value& OutputCache::store(PortId port, Value value) {
    auto [it, inserted] = m_values.emplace(port, std::move(value));
    if (!inserted) {
        throw CacheInvariantError("Output port " + std::to_string(port) + " populated twice");
    }
    return it->second;
}

} // namespace nodes
