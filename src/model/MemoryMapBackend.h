#pragma once

#include "model/MapBackend.h"

#include <QHash>
#include <QString>
#include <QVector>

/**
 * Backend keeping every record in memory.
 *
 * Only string properties are stored; numbers and vectors use the default encodings of
 * MapBackend. Removal is soft: a removed record keeps its properties and links, and validity is
 * derived (a node needs a valid parent chain, an edge needs both endpoints valid).
 */
class MemoryMapBackend : public MapBackend {
public:
    MemoryMapBackend();
    ~MemoryMapBackend() override;

    QString getPString(EntityId entityId, const QString& propertyName) override;
    bool setPString(EntityId entityId, const QString& propertyName, const QString& value) override;
    bool clearProperty(EntityId entityId, const QString& propertyName) override;

    EntityId getNodeParent(EntityId nodeId) override;
    bool setNodeParent(EntityId nodeId, EntityId parentId) override;
    QVector<NodeRef> getNodeChildren(EntityId nodeId) override;
    NodeKind getNodeType(EntityId nodeId) override;
    QVector<DirEdgeRef> getNodeEdges(EntityId nodeId) override;
    QVector<NodeRef> getEdgeNodes(EntityId edgeId) override;
    EdgeRef getEdgeBetween(EntityId nodeAId, EntityId nodeBId) override;

    bool entityExists(EntityId entityId) override;
    bool entityValid(EntityId entityId) override;
    bool removeEntity(EntityId entityId) override;
    bool unremoveEntity(EntityId entityId) override;
    EntityId globalEntityId() override { return m_globalId; }

    QVector<NodeRef> getNodesInArea(const Box3& box) override;
    QVector<NodeRef> getObjectNodesTouchingArea(const Box3& box, double minRadius) override;

    bool nodeHasChildren(EntityId nodeId) override;

    // Every record ever created, removed ones included.
    int recordCount() const { return m_records.size(); }

protected:
    EntityId createEntityRecord(EntityKind kind) override;
    EntityId createNodeRecord(EntityId parentId, NodeKind kind) override;
    EntityId createEdgeRecord(EntityId nodeAId, EntityId nodeBId) override;

private:
    struct Record {
        EntityKind kind = EntityKind::Node;
        bool removed = false;
        QHash<QString, QString> properties;

        // Nodes.
        EntityId parent = kInvalidEntityId;
        NodeKind nodeKind = NodeKind::Object;
        QVector<EntityId> children;
        QVector<EntityId> edges;

        // Edges.
        EntityId nodeA = kInvalidEntityId;
        EntityId nodeB = kInvalidEntityId;
    };

    Record* record(EntityId id);
    Record* nodeRecord(EntityId id);
    Record* edgeRecord(EntityId id);
    bool nodeValid(EntityId id);
    bool centerOf(EntityId id, Vector3* center);

    QHash<EntityId, Record> m_records;
    // Creation order, used to keep query results deterministic.
    QVector<EntityId> m_order;
    EntityId m_nextId = 1;
    EntityId m_globalId = kInvalidEntityId;
};
