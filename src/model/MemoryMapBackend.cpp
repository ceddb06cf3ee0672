#include "MemoryMapBackend.h"

#include "app/LogCategories.h"

MemoryMapBackend::MemoryMapBackend() {
    m_globalId = createEntity(EntityKind::Global).id();
}

MemoryMapBackend::~MemoryMapBackend() = default;

MemoryMapBackend::Record* MemoryMapBackend::record(EntityId id) {
    const auto it = m_records.find(id);
    if (it == m_records.end()) {
        return nullptr;
    }
    return &it.value();
}

MemoryMapBackend::Record* MemoryMapBackend::nodeRecord(EntityId id) {
    Record* found = record(id);
    return found && found->kind == EntityKind::Node ? found : nullptr;
}

MemoryMapBackend::Record* MemoryMapBackend::edgeRecord(EntityId id) {
    Record* found = record(id);
    return found && found->kind == EntityKind::Edge ? found : nullptr;
}

bool MemoryMapBackend::nodeValid(EntityId id) {
    // The parent chain is acyclic, so this walk ends at a root.
    for (EntityId current = id; current != kInvalidEntityId;) {
        const Record* node = nodeRecord(current);
        if (!node || node->removed) {
            return false;
        }
        current = node->parent;
    }
    return true;
}

bool MemoryMapBackend::centerOf(EntityId id, Vector3* center) {
    const Record* node = nodeRecord(id);
    if (!node) {
        return false;
    }
    const QString text = node->properties.value(NodeProperty::center());
    if (text.isNull()) {
        return false;
    }
    bool ok = false;
    *center = Vector3::fromString(text, &ok);
    return ok;
}

QString MemoryMapBackend::getPString(EntityId entityId, const QString& propertyName) {
    const Record* found = record(entityId);
    if (!found) {
        return QString();
    }
    return found->properties.value(propertyName);
}

bool MemoryMapBackend::setPString(EntityId entityId, const QString& propertyName, const QString& value) {
    Record* found = record(entityId);
    if (!found) {
        return false;
    }
    found->properties.insert(propertyName, value);
    return true;
}

bool MemoryMapBackend::clearProperty(EntityId entityId, const QString& propertyName) {
    Record* found = record(entityId);
    if (!found) {
        return false;
    }
    found->properties.remove(propertyName);
    return true;
}

EntityId MemoryMapBackend::createEntityRecord(EntityKind kind) {
    const EntityId id = m_nextId++;
    Record created;
    created.kind = kind;
    m_records.insert(id, created);
    m_order.push_back(id);
    return id;
}

EntityId MemoryMapBackend::createNodeRecord(EntityId parentId, NodeKind kind) {
    Record* parent = nullptr;
    if (parentId != kInvalidEntityId) {
        parent = nodeRecord(parentId);
        if (!parent) {
            qCWarning(lcModel) << "Parent node" << parentId << "does not exist";
            return kInvalidEntityId;
        }
    }

    const EntityId id = createEntityRecord(EntityKind::Node);
    Record& node = m_records[id];
    node.nodeKind = kind;
    node.parent = parentId;
    if (parentId != kInvalidEntityId) {
        // The insertion above may have rehashed the table.
        nodeRecord(parentId)->children.push_back(id);
    }
    return id;
}

EntityId MemoryMapBackend::createEdgeRecord(EntityId nodeAId, EntityId nodeBId) {
    if (!nodeRecord(nodeAId) || !nodeRecord(nodeBId)) {
        qCWarning(lcModel) << "Cannot connect" << nodeAId << "and" << nodeBId << ": missing node";
        return kInvalidEntityId;
    }

    const EntityId id = createEntityRecord(EntityKind::Edge);
    Record& edge = m_records[id];
    edge.nodeA = nodeAId;
    edge.nodeB = nodeBId;
    nodeRecord(nodeAId)->edges.push_back(id);
    nodeRecord(nodeBId)->edges.push_back(id);
    return id;
}

EntityId MemoryMapBackend::getNodeParent(EntityId nodeId) {
    const Record* node = nodeRecord(nodeId);
    return node ? node->parent : kInvalidEntityId;
}

bool MemoryMapBackend::setNodeParent(EntityId nodeId, EntityId parentId) {
    Record* node = nodeRecord(nodeId);
    if (!node) {
        return false;
    }
    if (parentId != kInvalidEntityId && !nodeRecord(parentId)) {
        qCWarning(lcModel) << "Parent node" << parentId << "does not exist";
        return false;
    }

    if (Record* oldParent = nodeRecord(node->parent)) {
        oldParent->children.removeAll(nodeId);
    }
    node->parent = parentId;
    if (Record* newParent = nodeRecord(parentId)) {
        newParent->children.push_back(nodeId);
    }
    return true;
}

QVector<NodeRef> MemoryMapBackend::getNodeChildren(EntityId nodeId) {
    QVector<NodeRef> result;
    const Record* node = nodeRecord(nodeId);
    if (!node) {
        return result;
    }
    const QVector<EntityId> children = node->children;
    for (EntityId childId : children) {
        if (nodeValid(childId)) {
            result.push_back(nodeRef(childId));
        }
    }
    return result;
}

bool MemoryMapBackend::nodeHasChildren(EntityId nodeId) {
    const Record* node = nodeRecord(nodeId);
    if (!node) {
        return false;
    }
    const QVector<EntityId> children = node->children;
    for (EntityId childId : children) {
        if (nodeValid(childId)) {
            return true;
        }
    }
    return false;
}

NodeKind MemoryMapBackend::getNodeType(EntityId nodeId) {
    const Record* node = nodeRecord(nodeId);
    return node ? node->nodeKind : NodeKind::Object;
}

QVector<DirEdgeRef> MemoryMapBackend::getNodeEdges(EntityId nodeId) {
    QVector<DirEdgeRef> result;
    const Record* node = nodeRecord(nodeId);
    if (!node) {
        return result;
    }
    const QVector<EntityId> edges = node->edges;
    for (EntityId edgeId : edges) {
        if (entityValid(edgeId)) {
            result.push_back(dirEdgeRef(edgeId, nodeId));
        }
    }
    return result;
}

QVector<NodeRef> MemoryMapBackend::getEdgeNodes(EntityId edgeId) {
    const Record* edge = edgeRecord(edgeId);
    if (!edge) {
        return QVector<NodeRef>();
    }
    return QVector<NodeRef>{nodeRef(edge->nodeA), nodeRef(edge->nodeB)};
}

EdgeRef MemoryMapBackend::getEdgeBetween(EntityId nodeAId, EntityId nodeBId) {
    const Record* node = nodeRecord(nodeAId);
    if (!node) {
        return EdgeRef();
    }
    const QVector<EntityId> edges = node->edges;
    for (EntityId edgeId : edges) {
        const Record* edge = edgeRecord(edgeId);
        const bool joins = edge && ((edge->nodeA == nodeAId && edge->nodeB == nodeBId)
                                    || (edge->nodeA == nodeBId && edge->nodeB == nodeAId));
        if (joins && entityValid(edgeId)) {
            return edgeRef(edgeId);
        }
    }
    return EdgeRef();
}

bool MemoryMapBackend::entityExists(EntityId entityId) {
    return m_records.contains(entityId);
}

bool MemoryMapBackend::entityValid(EntityId entityId) {
    const Record* found = record(entityId);
    if (!found || found->removed) {
        return false;
    }
    switch (found->kind) {
        case EntityKind::Node:
            return nodeValid(entityId);
        case EntityKind::Edge:
            return nodeValid(found->nodeA) && nodeValid(found->nodeB);
        case EntityKind::Global:
            return true;
    }
    return false;
}

bool MemoryMapBackend::removeEntity(EntityId entityId) {
    Record* found = record(entityId);
    if (!found) {
        return false;
    }
    if (found->kind == EntityKind::Global) {
        qCWarning(lcModel) << "The global entity cannot be removed";
        return false;
    }
    found->removed = true;
    return true;
}

bool MemoryMapBackend::unremoveEntity(EntityId entityId) {
    Record* found = record(entityId);
    if (!found) {
        return false;
    }
    found->removed = false;
    return true;
}

QVector<NodeRef> MemoryMapBackend::getNodesInArea(const Box3& box) {
    QVector<NodeRef> result;
    for (EntityId id : m_order) {
        Vector3 center;
        if (nodeRecord(id) && nodeValid(id) && centerOf(id, &center) && box.contains(center)) {
            result.push_back(nodeRef(id));
        }
    }
    return result;
}

QVector<NodeRef> MemoryMapBackend::getObjectNodesTouchingArea(const Box3& box, double minRadius) {
    QVector<NodeRef> result;
    for (EntityId id : m_order) {
        const Record* node = nodeRecord(id);
        if (!node || node->nodeKind != NodeKind::Object || !nodeValid(id)) {
            continue;
        }
        Vector3 center;
        if (!centerOf(id, &center)) {
            continue;
        }
        bool ok = false;
        const double radius = node->properties.value(NodeProperty::radius()).toDouble(&ok);
        if (!ok || radius < minRadius) {
            continue;
        }
        if (box.expanded(radius).contains(center)) {
            result.push_back(nodeRef(id));
        }
    }
    return result;
}
