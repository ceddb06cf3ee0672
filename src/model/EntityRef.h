#pragma once

#include "geometry/Geometry.h"
#include "model/MapTypes.h"

#include <QString>
#include <QVector>

class MapBackend;
class NodeTreeRange;
struct EntityCache;

/**
 * Handle to one entity of a backend.
 *
 * References are cheap values; they own nothing. Property reads and writes go through the
 * backend's shared per-id cache, so every reference to the same id sees the same values.
 * Obtain references from the MapBackend factory methods.
 */
class EntityRef {
public:
    EntityRef() = default;
    EntityRef(EntityId id, MapBackend* backend);
    virtual ~EntityRef() = default;

    EntityId id() const { return m_id; }
    MapBackend* backend() const { return m_backend; }
    bool isNull() const { return m_id == kInvalidEntityId || !m_backend; }

    // Never cached: removal state must always be current.
    bool exists() const;
    bool valid() const;

    bool hasProperty(const QString& propertyName) const;
    double getPNumber(const QString& propertyName, bool* ok = nullptr) const;
    QString getPString(const QString& propertyName) const;
    Vector3 getPVector3(const QString& propertyName, bool* ok = nullptr) const;

    // The cache is written first; it is rolled back if the backend rejects the write.
    bool setPNumber(const QString& propertyName, double value) const;
    bool setPString(const QString& propertyName, const QString& value) const;
    bool setPVector3(const QString& propertyName, const Vector3& value) const;
    bool clearProperty(const QString& propertyName) const;

    // Soft delete; unremove() restores the entity.
    virtual bool remove() const;
    virtual bool unremove() const;

    bool operator==(const EntityRef& other) const { return m_id == other.m_id && m_backend == other.m_backend; }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }

protected:
    EntityCache& cache() const;

    EntityId m_id = kInvalidEntityId;
    MapBackend* m_backend = nullptr;
};

class DirEdgeRef;

class NodeRef : public EntityRef {
public:
    using EntityRef::EntityRef;

    NodeKind kind() const;

    // Null reference when the node is a root.
    NodeRef getParent() const;
    // Rejects cycles: a node cannot become a child of itself or of one of its descendants.
    bool setParent(const NodeRef& newParent) const;
    QVector<NodeRef> getChildren() const;
    bool hasChildren() const;
    // Depth-first preorder, evaluated lazily from the current children each time it is iterated.
    NodeTreeRange getAllDescendants() const;
    NodeTreeRange getSelfAndAllDescendants() const;

    QVector<DirEdgeRef> getEdges() const;
    QVector<NodeRef> getNeighbors() const;

    Vector3 getCenter(bool* ok = nullptr) const;
    bool setCenter(const Vector3& center) const;
    // Falls back to the center when no effective center was set.
    Vector3 getEffectiveCenter() const;
    bool setEffectiveCenter(const Vector3& center) const;
    bool clearEffectiveCenter() const;
    // 0 when unset.
    double getRadius() const;
    bool setRadius(double radius) const;
    QString getTypeId() const;
    bool setTypeId(const QString& typeId) const;
    QString getLayer() const;
    bool setLayer(const QString& layer) const;
    QString getName() const;
    bool setName(const QString& name) const;

    bool remove() const override;
    bool unremove() const override;

    // Drops the parent's children list.
    void clearParentCache() const;
    // Drops edge and neighbor lists of this node and of every node it is connected to.
    void clearNeighborCache() const;
};

class EdgeRef : public EntityRef {
public:
    using EntityRef::EntityRef;

    // Both endpoints, order decided by the backend.
    QVector<NodeRef> getNodes() const;
    NodeRef getOtherNode(EntityId knownNodeId) const;
    // Segment between the endpoint centers; ok is false for an edge without two endpoints.
    Line3 getLine(bool* ok = nullptr) const;

    bool remove() const override;
    bool unremove() const override;

private:
    void clearEndpointCaches(const QVector<NodeRef>& endpoints) const;
};

class DirEdgeRef : public EdgeRef {
public:
    DirEdgeRef() = default;
    DirEdgeRef(EntityId id, EntityId startId, MapBackend* backend);

    EntityId startId() const { return m_startId; }
    NodeRef getDirOtherNode() const;

private:
    EntityId m_startId = kInvalidEntityId;
};

class NodeTreeIterator {
public:
    NodeTreeIterator() = default;
    explicit NodeTreeIterator(const QVector<NodeRef>& roots);

    const NodeRef& operator*() const { return m_stack.last(); }
    const NodeRef* operator->() const { return &m_stack.last(); }
    NodeTreeIterator& operator++();
    bool operator==(const NodeTreeIterator& other) const;
    bool operator!=(const NodeTreeIterator& other) const { return !(*this == other); }

private:
    // Top of the stack is the current node.
    QVector<NodeRef> m_stack;
};

class NodeTreeRange {
public:
    NodeTreeRange(const NodeRef& root, bool includeRoot);

    NodeTreeIterator begin() const;
    NodeTreeIterator end() const { return NodeTreeIterator(); }
    QVector<NodeRef> toVector() const;

private:
    NodeRef m_root;
    bool m_includeRoot = false;
};
