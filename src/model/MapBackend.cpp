#include "MapBackend.h"

#include "app/LogCategories.h"

#include <QSet>

MapBackend::MapBackend() = default;

MapBackend::~MapBackend() = default;

double MapBackend::getPNumber(EntityId entityId, const QString& propertyName, bool* ok) {
    if (ok) {
        *ok = false;
    }
    const QString text = getPString(entityId, propertyName);
    if (text.isNull()) {
        return 0.0;
    }

    bool parsed = false;
    const double value = text.toDouble(&parsed);
    if (!parsed) {
        qCWarning(lcModel) << "Malformed number property" << propertyName << "on entity" << entityId << ":" << text;
        return 0.0;
    }
    if (ok) {
        *ok = true;
    }
    return value;
}

bool MapBackend::setPNumber(EntityId entityId, const QString& propertyName, double value) {
    return setPString(entityId, propertyName, QString::number(value, 'g', 17));
}

Vector3 MapBackend::getPVector3(EntityId entityId, const QString& propertyName, bool* ok) {
    if (ok) {
        *ok = false;
    }
    const QString text = getPString(entityId, propertyName);
    if (text.isNull()) {
        return Vector3();
    }

    bool parsed = false;
    const Vector3 value = Vector3::fromString(text, &parsed);
    if (!parsed) {
        qCWarning(lcModel) << "Malformed vector property" << propertyName << "on entity" << entityId << ":" << text;
        return Vector3();
    }
    if (ok) {
        *ok = true;
    }
    return value;
}

bool MapBackend::setPVector3(EntityId entityId, const QString& propertyName, const Vector3& value) {
    return setPString(entityId, propertyName, value.toString());
}

EntityRef MapBackend::createEntity(EntityKind kind) {
    return entityRef(createEntityRecord(kind));
}

NodeRef MapBackend::createNode(EntityId parentId, NodeKind kind) {
    const EntityId id = createNodeRecord(parentId, kind);
    if (id == kInvalidEntityId) {
        qCWarning(lcModel) << "Backend refused to create node under parent" << parentId;
        return NodeRef();
    }

    const NodeRef node = nodeRef(id);
    entityCache(id).parent = parentId;
    node.clearParentCache();
    qCDebug(lcModel) << "Created" << nodeKindName(kind) << "node" << id << "parent" << parentId;
    return node;
}

EdgeRef MapBackend::createEdge(EntityId nodeAId, EntityId nodeBId) {
    if (nodeAId == nodeBId) {
        qCWarning(lcModel) << "Refusing to connect node" << nodeAId << "to itself";
        return EdgeRef();
    }

    const EntityId id = createEdgeRecord(nodeAId, nodeBId);
    if (id == kInvalidEntityId) {
        qCWarning(lcModel) << "Backend refused to create edge between" << nodeAId << "and" << nodeBId;
        return EdgeRef();
    }

    entityCache(nodeAId).clearAdjacency();
    entityCache(nodeBId).clearAdjacency();
    qCDebug(lcModel) << "Created edge" << id << "between" << nodeAId << "and" << nodeBId;
    return edgeRef(id);
}

bool MapBackend::nodeHasChildren(EntityId nodeId) {
    return !getNodeChildren(nodeId).isEmpty();
}

NodeRef MapBackend::getEdgeOtherNode(EntityId edgeId, EntityId nodeId) {
    const QVector<NodeRef> nodes = getEdgeNodes(edgeId);
    if (nodes.size() != 2) {
        qCCritical(lcModel) << "Edge" << edgeId << "has" << nodes.size() << "endpoints";
        return NodeRef();
    }
    return nodes[0].id() == nodeId ? nodes[1] : nodes[0];
}

bool MapBackend::removeEdge(EntityId edgeId) {
    return removeEntity(edgeId);
}

bool MapBackend::removeNode(EntityId nodeId) {
    return removeEntity(nodeId);
}

bool MapBackend::flush() {
    return true;
}

QVector<NodeRef> MapBackend::getNearbyNodes(const NodeRef& nodeRef, double blendDistance) {
    QVector<NodeRef> result;
    for (const NodeRef& other : getNodesInArea(Box3::fromRadius(nodeRef.getCenter(), blendDistance))) {
        if (other.id() != nodeRef.id()) {
            result.push_back(other);
        }
    }
    return result;
}

QVector<NodeRef> MapBackend::getConnectedNodes(const NodeRef& nodeRef) {
    QVector<NodeRef> result;
    for (const DirEdgeRef& edge : nodeRef.getEdges()) {
        const NodeRef other = edge.getDirOtherNode();
        if (!other.isNull()) {
            result.push_back(other);
        }
    }
    return result;
}

QVector<DirEdgeRef> MapBackend::getIntersectingEdges(const EdgeRef& edgeRef, double blendDistance) {
    QVector<DirEdgeRef> result;
    bool lineOk = false;
    const Line3 line = edgeRef.getLine(&lineOk);
    if (!lineOk) {
        return result;
    }

    QSet<EntityId> seen;
    seen.insert(edgeRef.id());

    const Box3 area = Box3{line.fullMin(), line.fullMax()}.expanded(blendDistance);
    for (const NodeRef& node : getNodesInArea(area)) {
        for (const DirEdgeRef& edge : node.getEdges()) {
            if (seen.contains(edge.id())) {
                continue;
            }
            seen.insert(edge.id());

            bool otherOk = false;
            const Line3 otherLine = edge.getLine(&otherOk);
            if (otherOk && line.intersects2(otherLine)) {
                result.push_back(edge);
            }
        }
    }
    return result;
}

EntityRef MapBackend::entityRef(EntityId id) {
    return EntityRef(id, this);
}

NodeRef MapBackend::nodeRef(EntityId id) {
    return NodeRef(id, this);
}

EdgeRef MapBackend::edgeRef(EntityId id) {
    return EdgeRef(id, this);
}

DirEdgeRef MapBackend::dirEdgeRef(EntityId id, EntityId startId) {
    return DirEdgeRef(id, startId, this);
}

EntityRef MapBackend::global() {
    return entityRef(globalEntityId());
}
