#pragma once

#include "model/MapTypes.h"

#include <QHash>
#include <QString>
#include <QVariant>
#include <QVector>

#include <optional>
#include <unordered_map>

// Memoized facts about one entity. Each field is dropped on its own when the fact it mirrors changes.
struct EntityCache {
    // Values are double, QString or Vector3.
    QHash<QString, QVariant> properties;
    // kInvalidEntityId means "no parent".
    std::optional<EntityId> parent;
    std::optional<QVector<EntityId>> children;
    std::optional<QVector<EntityId>> edges;
    std::optional<QVector<EntityId>> neighbors;

    void clearAdjacency();
};

class EntityCacheStore {
public:
    // Created on first use; shared by every reference to the same id. References stay valid
    // while other entries are added.
    EntityCache& entry(EntityId id);
    const EntityCache* find(EntityId id) const;
    bool contains(EntityId id) const;
    int size() const;
    void clear();

private:
    std::unordered_map<EntityId, EntityCache> m_entries;
};
