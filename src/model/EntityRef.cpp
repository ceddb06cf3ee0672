#include "EntityRef.h"

#include "app/LogCategories.h"
#include "model/EntityCache.h"
#include "model/MapBackend.h"

#include <QSet>

#include <algorithm>

namespace {
bool isVector(const QVariant& value) {
    return value.userType() == qMetaTypeId<Vector3>();
}

bool isNumber(const QVariant& value) {
    return value.userType() == QMetaType::Double;
}

QString variantToString(const QVariant& value) {
    if (isNumber(value)) {
        return QString::number(value.toDouble(), 'g', 17);
    }
    if (isVector(value)) {
        return value.value<Vector3>().toString();
    }
    return value.toString();
}
}  // namespace

EntityRef::EntityRef(EntityId id, MapBackend* backend)
    : m_id(id),
      m_backend(backend) {}

EntityCache& EntityRef::cache() const {
    return m_backend->entityCache(m_id);
}

bool EntityRef::exists() const {
    return !isNull() && m_backend->entityExists(m_id);
}

bool EntityRef::valid() const {
    return !isNull() && m_backend->entityValid(m_id);
}

bool EntityRef::hasProperty(const QString& propertyName) const {
    if (isNull()) {
        return false;
    }
    if (cache().properties.contains(propertyName)) {
        return true;
    }
    return !m_backend->getPString(m_id, propertyName).isNull();
}

double EntityRef::getPNumber(const QString& propertyName, bool* ok) const {
    if (ok) {
        *ok = false;
    }
    if (isNull()) {
        return 0.0;
    }

    const QVariant cached = cache().properties.value(propertyName);
    if (cached.isValid() && !isVector(cached)) {
        bool converted = false;
        const double value = isNumber(cached) ? cached.toDouble() : cached.toString().toDouble(&converted);
        if (isNumber(cached) || converted) {
            if (ok) {
                *ok = true;
            }
            return value;
        }
    }
    if (cached.isValid()) {
        qCWarning(lcModel) << "Property" << propertyName << "on entity" << m_id << "is not a number";
        return 0.0;
    }

    bool fetched = false;
    const double value = m_backend->getPNumber(m_id, propertyName, &fetched);
    if (fetched) {
        cache().properties.insert(propertyName, value);
    }
    if (ok) {
        *ok = fetched;
    }
    return value;
}

QString EntityRef::getPString(const QString& propertyName) const {
    if (isNull()) {
        return QString();
    }

    const QVariant cached = cache().properties.value(propertyName);
    if (cached.isValid()) {
        return variantToString(cached);
    }

    const QString value = m_backend->getPString(m_id, propertyName);
    if (!value.isNull()) {
        cache().properties.insert(propertyName, value);
    }
    return value;
}

Vector3 EntityRef::getPVector3(const QString& propertyName, bool* ok) const {
    if (ok) {
        *ok = false;
    }
    if (isNull()) {
        return Vector3();
    }

    const QVariant cached = cache().properties.value(propertyName);
    if (cached.isValid()) {
        if (isVector(cached)) {
            if (ok) {
                *ok = true;
            }
            return cached.value<Vector3>();
        }
        bool parsed = false;
        const Vector3 value = Vector3::fromString(variantToString(cached), &parsed);
        if (!parsed) {
            qCWarning(lcModel) << "Property" << propertyName << "on entity" << m_id << "is not a vector";
        }
        if (ok) {
            *ok = parsed;
        }
        return value;
    }

    bool fetched = false;
    const Vector3 value = m_backend->getPVector3(m_id, propertyName, &fetched);
    if (fetched) {
        cache().properties.insert(propertyName, QVariant::fromValue(value));
    }
    if (ok) {
        *ok = fetched;
    }
    return value;
}

bool EntityRef::setPNumber(const QString& propertyName, double value) const {
    if (isNull()) {
        return false;
    }
    EntityCache& entry = cache();
    const QVariant previous = entry.properties.value(propertyName);
    entry.properties.insert(propertyName, value);
    if (m_backend->setPNumber(m_id, propertyName, value)) {
        return true;
    }

    qCWarning(lcModel) << "Cannot set number property" << propertyName << "on missing entity" << m_id;
    if (previous.isValid()) {
        entry.properties.insert(propertyName, previous);
    } else {
        entry.properties.remove(propertyName);
    }
    return false;
}

bool EntityRef::setPString(const QString& propertyName, const QString& value) const {
    if (isNull()) {
        return false;
    }
    EntityCache& entry = cache();
    const QVariant previous = entry.properties.value(propertyName);
    entry.properties.insert(propertyName, value);
    if (m_backend->setPString(m_id, propertyName, value)) {
        return true;
    }

    qCWarning(lcModel) << "Cannot set string property" << propertyName << "on missing entity" << m_id;
    if (previous.isValid()) {
        entry.properties.insert(propertyName, previous);
    } else {
        entry.properties.remove(propertyName);
    }
    return false;
}

bool EntityRef::setPVector3(const QString& propertyName, const Vector3& value) const {
    if (isNull()) {
        return false;
    }
    EntityCache& entry = cache();
    const QVariant previous = entry.properties.value(propertyName);
    entry.properties.insert(propertyName, QVariant::fromValue(value));
    if (m_backend->setPVector3(m_id, propertyName, value)) {
        return true;
    }

    qCWarning(lcModel) << "Cannot set vector property" << propertyName << "on missing entity" << m_id;
    if (previous.isValid()) {
        entry.properties.insert(propertyName, previous);
    } else {
        entry.properties.remove(propertyName);
    }
    return false;
}

bool EntityRef::clearProperty(const QString& propertyName) const {
    if (isNull()) {
        return false;
    }
    EntityCache& entry = cache();
    const QVariant previous = entry.properties.take(propertyName);
    if (m_backend->clearProperty(m_id, propertyName)) {
        return true;
    }

    qCWarning(lcModel) << "Cannot clear property" << propertyName << "on missing entity" << m_id;
    if (previous.isValid()) {
        entry.properties.insert(propertyName, previous);
    }
    return false;
}

bool EntityRef::remove() const {
    return !isNull() && m_backend->removeEntity(m_id);
}

bool EntityRef::unremove() const {
    return !isNull() && m_backend->unremoveEntity(m_id);
}

NodeKind NodeRef::kind() const {
    if (isNull()) {
        return NodeKind::Object;
    }
    return m_backend->getNodeType(m_id);
}

NodeRef NodeRef::getParent() const {
    if (isNull()) {
        return NodeRef();
    }
    EntityCache& entry = cache();
    if (!entry.parent) {
        entry.parent = m_backend->getNodeParent(m_id);
    }
    if (*entry.parent == kInvalidEntityId) {
        return NodeRef();
    }
    return m_backend->nodeRef(*entry.parent);
}

bool NodeRef::setParent(const NodeRef& newParent) const {
    if (isNull()) {
        return false;
    }
    for (NodeRef ancestor = newParent; !ancestor.isNull(); ancestor = ancestor.getParent()) {
        if (ancestor.id() == m_id) {
            qCWarning(lcModel) << "Rejected parent" << newParent.id() << "for node" << m_id << ": would form a cycle";
            return false;
        }
    }

    const NodeRef oldParent = getParent();
    const EntityId newParentId = newParent.isNull() ? kInvalidEntityId : newParent.id();
    if (!m_backend->setNodeParent(m_id, newParentId)) {
        return false;
    }

    if (!oldParent.isNull()) {
        oldParent.cache().children.reset();
    }
    cache().parent = newParentId;
    if (!newParent.isNull()) {
        newParent.cache().children.reset();
    }
    return true;
}

QVector<NodeRef> NodeRef::getChildren() const {
    QVector<NodeRef> result;
    if (isNull()) {
        return result;
    }

    EntityCache& entry = cache();
    if (!entry.children) {
        QVector<EntityId> ids;
        for (const NodeRef& child : m_backend->getNodeChildren(m_id)) {
            ids.push_back(child.id());
        }
        entry.children = ids;
    }

    result.reserve(entry.children->size());
    for (EntityId id : *entry.children) {
        result.push_back(m_backend->nodeRef(id));
    }
    return result;
}

bool NodeRef::hasChildren() const {
    if (isNull()) {
        return false;
    }
    const EntityCache& entry = cache();
    if (entry.children) {
        return !entry.children->isEmpty();
    }
    return m_backend->nodeHasChildren(m_id);
}

NodeTreeRange NodeRef::getAllDescendants() const {
    return NodeTreeRange(*this, false);
}

NodeTreeRange NodeRef::getSelfAndAllDescendants() const {
    return NodeTreeRange(*this, true);
}

QVector<DirEdgeRef> NodeRef::getEdges() const {
    QVector<DirEdgeRef> result;
    if (isNull()) {
        return result;
    }

    EntityCache& entry = cache();
    if (!entry.edges) {
        QVector<EntityId> ids;
        for (const DirEdgeRef& edge : m_backend->getNodeEdges(m_id)) {
            ids.push_back(edge.id());
        }
        entry.edges = ids;
    }

    result.reserve(entry.edges->size());
    for (EntityId id : *entry.edges) {
        result.push_back(m_backend->dirEdgeRef(id, m_id));
    }
    return result;
}

QVector<NodeRef> NodeRef::getNeighbors() const {
    QVector<NodeRef> result;
    if (isNull()) {
        return result;
    }

    if (!cache().neighbors) {
        QVector<EntityId> ids;
        for (const DirEdgeRef& edge : getEdges()) {
            const NodeRef other = edge.getDirOtherNode();
            if (!other.isNull()) {
                ids.push_back(other.id());
            }
        }
        cache().neighbors = ids;
    }

    const QVector<EntityId> ids = *cache().neighbors;
    result.reserve(ids.size());
    for (EntityId id : ids) {
        result.push_back(m_backend->nodeRef(id));
    }
    return result;
}

Vector3 NodeRef::getCenter(bool* ok) const {
    return getPVector3(NodeProperty::center(), ok);
}

bool NodeRef::setCenter(const Vector3& center) const {
    return setPVector3(NodeProperty::center(), center);
}

Vector3 NodeRef::getEffectiveCenter() const {
    bool ok = false;
    const Vector3 effective = getPVector3(NodeProperty::effectiveCenter(), &ok);
    return ok ? effective : getCenter();
}

bool NodeRef::setEffectiveCenter(const Vector3& center) const {
    return setPVector3(NodeProperty::effectiveCenter(), center);
}

bool NodeRef::clearEffectiveCenter() const {
    return clearProperty(NodeProperty::effectiveCenter());
}

double NodeRef::getRadius() const {
    bool ok = false;
    const double radius = getPNumber(NodeProperty::radius(), &ok);
    return ok ? radius : 0.0;
}

bool NodeRef::setRadius(double radius) const {
    return setPNumber(NodeProperty::radius(), radius);
}

QString NodeRef::getTypeId() const {
    return getPString(NodeProperty::type());
}

bool NodeRef::setTypeId(const QString& typeId) const {
    return setPString(NodeProperty::type(), typeId);
}

QString NodeRef::getLayer() const {
    return getPString(NodeProperty::layer());
}

bool NodeRef::setLayer(const QString& layer) const {
    return setPString(NodeProperty::layer(), layer);
}

QString NodeRef::getName() const {
    return getPString(NodeProperty::name());
}

bool NodeRef::setName(const QString& name) const {
    return setPString(NodeProperty::name(), name);
}

void NodeRef::clearParentCache() const {
    const NodeRef parent = getParent();
    if (!parent.isNull()) {
        parent.cache().children.reset();
    }
}

void NodeRef::clearNeighborCache() const {
    if (isNull()) {
        return;
    }
    const QVector<NodeRef> neighbors = getNeighbors();
    cache().clearAdjacency();
    for (const NodeRef& neighbor : neighbors) {
        neighbor.cache().clearAdjacency();
    }
}

bool NodeRef::remove() const {
    if (!exists()) {
        return false;
    }

    // Removal hides the whole subtree and every edge touching it.
    const QVector<NodeRef> affected = getSelfAndAllDescendants().toVector();
    clearParentCache();
    for (const NodeRef& node : affected) {
        node.clearNeighborCache();
        node.cache().children.reset();
    }
    return m_backend->removeNode(m_id);
}

bool NodeRef::unremove() const {
    if (!exists()) {
        return false;
    }

    cache().children.reset();
    cache().clearAdjacency();
    if (!m_backend->unremoveEntity(m_id)) {
        return false;
    }
    clearParentCache();

    for (const NodeRef& node : getSelfAndAllDescendants().toVector()) {
        node.cache().children.reset();
        node.clearNeighborCache();
    }
    return true;
}

QVector<NodeRef> EdgeRef::getNodes() const {
    if (isNull()) {
        return QVector<NodeRef>();
    }
    return m_backend->getEdgeNodes(m_id);
}

NodeRef EdgeRef::getOtherNode(EntityId knownNodeId) const {
    if (isNull()) {
        return NodeRef();
    }
    return m_backend->getEdgeOtherNode(m_id, knownNodeId);
}

Line3 EdgeRef::getLine(bool* ok) const {
    const QVector<NodeRef> nodes = getNodes();
    if (nodes.size() != 2) {
        qCCritical(lcModel) << "Edge" << m_id << "has" << nodes.size() << "endpoints";
        if (ok) {
            *ok = false;
        }
        return Line3();
    }
    if (ok) {
        *ok = true;
    }
    return Line3{nodes[0].getCenter(), nodes[1].getCenter()};
}

void EdgeRef::clearEndpointCaches(const QVector<NodeRef>& endpoints) const {
    for (const NodeRef& node : endpoints) {
        node.clearNeighborCache();
    }
}

bool EdgeRef::remove() const {
    if (isNull()) {
        return false;
    }
    const QVector<NodeRef> endpoints = getNodes();
    if (!m_backend->removeEdge(m_id)) {
        return false;
    }
    clearEndpointCaches(endpoints);
    return true;
}

bool EdgeRef::unremove() const {
    if (isNull() || !m_backend->unremoveEntity(m_id)) {
        return false;
    }
    clearEndpointCaches(getNodes());
    return true;
}

DirEdgeRef::DirEdgeRef(EntityId id, EntityId startId, MapBackend* backend)
    : EdgeRef(id, backend),
      m_startId(startId) {}

NodeRef DirEdgeRef::getDirOtherNode() const {
    return getOtherNode(m_startId);
}

NodeTreeIterator::NodeTreeIterator(const QVector<NodeRef>& roots) {
    for (auto it = roots.crbegin(); it != roots.crend(); ++it) {
        m_stack.push_back(*it);
    }
}

NodeTreeIterator& NodeTreeIterator::operator++() {
    if (m_stack.isEmpty()) {
        return *this;
    }
    const NodeRef current = m_stack.takeLast();
    const QVector<NodeRef> children = current.getChildren();
    for (auto it = children.crbegin(); it != children.crend(); ++it) {
        m_stack.push_back(*it);
    }
    return *this;
}

bool NodeTreeIterator::operator==(const NodeTreeIterator& other) const {
    if (m_stack.isEmpty() || other.m_stack.isEmpty()) {
        return m_stack.isEmpty() && other.m_stack.isEmpty();
    }
    return m_stack.size() == other.m_stack.size() && m_stack.last() == other.m_stack.last();
}

NodeTreeRange::NodeTreeRange(const NodeRef& root, bool includeRoot)
    : m_root(root),
      m_includeRoot(includeRoot) {}

NodeTreeIterator NodeTreeRange::begin() const {
    if (m_root.isNull()) {
        return NodeTreeIterator();
    }
    if (m_includeRoot) {
        return NodeTreeIterator(QVector<NodeRef>{m_root});
    }
    return NodeTreeIterator(m_root.getChildren());
}

QVector<NodeRef> NodeTreeRange::toVector() const {
    QVector<NodeRef> result;
    for (const NodeRef& node : *this) {
        result.push_back(node);
    }
    return result;
}
