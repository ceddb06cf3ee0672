#pragma once

#include "geometry/Geometry.h"
#include "model/EntityCache.h"
#include "model/EntityRef.h"
#include "model/MapTypes.h"

#include <QString>
#include <QVector>

/**
 * Storage contract of a map.
 *
 * A map is a set of entities with arbitrary properties. One "global" entity carries map-wide
 * properties. Nodes form a forest through their parent links and carry spatial properties; edges
 * connect two nodes.
 *
 * The pure virtual methods are what a storage engine has to provide. The virtual methods with a
 * body are backend-independent defaults built on top of them; a backend may override them to use
 * a faster native query. Code outside a backend should go through the references, which keep the
 * shared EntityCache consistent.
 */
class MapBackend {
public:
    MapBackend();
    virtual ~MapBackend();

    MapBackend(const MapBackend&) = delete;
    MapBackend& operator=(const MapBackend&) = delete;

    // Properties. Null string when the property is unset.
    virtual QString getPString(EntityId entityId, const QString& propertyName) = 0;
    // False when the entity does not exist.
    virtual bool setPString(EntityId entityId, const QString& propertyName, const QString& value) = 0;
    // Makes the property unset again. False when the entity does not exist.
    virtual bool clearProperty(EntityId entityId, const QString& propertyName) = 0;

    // Defaults stored through the string form. Malformed or missing values set ok to false.
    virtual double getPNumber(EntityId entityId, const QString& propertyName, bool* ok = nullptr);
    virtual bool setPNumber(EntityId entityId, const QString& propertyName, double value);
    virtual Vector3 getPVector3(EntityId entityId, const QString& propertyName, bool* ok = nullptr);
    virtual bool setPVector3(EntityId entityId, const QString& propertyName, const Vector3& value);

    // Creation. The returned references are registered with the cache (the new node is
    // visible in its parent's children, the new edge in both endpoints' edge lists).
    EntityRef createEntity(EntityKind kind);
    NodeRef createNode(EntityId parentId, NodeKind kind);
    EdgeRef createEdge(EntityId nodeAId, EntityId nodeBId);

    // Structure. Parent and endpoint queries are structural; children and edge queries only
    // report valid entities.
    virtual EntityId getNodeParent(EntityId nodeId) = 0;
    virtual bool setNodeParent(EntityId nodeId, EntityId parentId) = 0;
    virtual QVector<NodeRef> getNodeChildren(EntityId nodeId) = 0;
    virtual NodeKind getNodeType(EntityId nodeId) = 0;
    virtual QVector<DirEdgeRef> getNodeEdges(EntityId nodeId) = 0;
    virtual QVector<NodeRef> getEdgeNodes(EntityId edgeId) = 0;
    // Null reference when the nodes are not connected.
    virtual EdgeRef getEdgeBetween(EntityId nodeAId, EntityId nodeBId) = 0;

    virtual bool entityExists(EntityId entityId) = 0;
    // Exists and is not removed.
    virtual bool entityValid(EntityId entityId) = 0;
    virtual bool removeEntity(EntityId entityId) = 0;
    virtual bool unremoveEntity(EntityId entityId) = 0;
    virtual EntityId globalEntityId() = 0;

    // Spatial queries. Only valid nodes are reported.
    virtual QVector<NodeRef> getNodesInArea(const Box3& box) = 0;
    // Object nodes with radius >= minRadius whose circle reaches into the box.
    virtual QVector<NodeRef> getObjectNodesTouchingArea(const Box3& box, double minRadius) = 0;

    virtual bool nodeHasChildren(EntityId nodeId);
    virtual NodeRef getEdgeOtherNode(EntityId edgeId, EntityId nodeId);
    virtual bool removeEdge(EntityId edgeId);
    virtual bool removeNode(EntityId nodeId);
    // Writes pending state to storage. Nothing to do by default.
    virtual bool flush();

    // Nodes whose center lies in the box of the given half-size around the node's center,
    // the node itself excluded.
    virtual QVector<NodeRef> getNearbyNodes(const NodeRef& nodeRef, double blendDistance);
    virtual QVector<NodeRef> getConnectedNodes(const NodeRef& nodeRef);
    // Every edge crossing the given one in the XY plane, each reported once, the edge itself never.
    virtual QVector<DirEdgeRef> getIntersectingEdges(const EdgeRef& edgeRef, double blendDistance);

    EntityRef entityRef(EntityId id);
    NodeRef nodeRef(EntityId id);
    EdgeRef edgeRef(EntityId id);
    DirEdgeRef dirEdgeRef(EntityId id, EntityId startId);
    EntityRef global();

    EntityCacheStore& cacheStore() { return m_cacheStore; }
    EntityCache& entityCache(EntityId id) { return m_cacheStore.entry(id); }

protected:
    virtual EntityId createEntityRecord(EntityKind kind) = 0;
    virtual EntityId createNodeRecord(EntityId parentId, NodeKind kind) = 0;
    virtual EntityId createEdgeRecord(EntityId nodeAId, EntityId nodeBId) = 0;

private:
    EntityCacheStore m_cacheStore;
};
