#include "EntityCache.h"

void EntityCache::clearAdjacency() {
    edges.reset();
    neighbors.reset();
}

EntityCache& EntityCacheStore::entry(EntityId id) {
    return m_entries[id];
}

const EntityCache* EntityCacheStore::find(EntityId id) const {
    const auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return nullptr;
    }
    return &it->second;
}

bool EntityCacheStore::contains(EntityId id) const {
    return m_entries.find(id) != m_entries.end();
}

int EntityCacheStore::size() const {
    return static_cast<int>(m_entries.size());
}

void EntityCacheStore::clear() {
    m_entries.clear();
}
