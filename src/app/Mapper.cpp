#include "Mapper.h"

#include "actions/Action.h"
#include "app/LogCategories.h"
#include "commands/ActionCommand.h"
#include "model/MapBackend.h"

#include <QSet>
#include <QUndoStack>

Mapper::Mapper(MapBackend* backend, const MapSettings& settings, QObject* parent)
    : QObject(parent),
      m_backend(backend),
      m_settings(settings) {}

Mapper::~Mapper() = default;

void Mapper::setSettings(const MapSettings& settings) {
    m_settings = settings;
    if (m_undoStack) {
        m_undoStack->setUndoLimit(m_settings.undoLimit);
    }
}

NodeRef Mapper::insertNode(const Vector3& point, const NodeInsertOptions& options) {
    const EntityId parentId = options.parent.isNull() ? kInvalidEntityId : options.parent.id();
    const NodeRef node = m_backend->createNode(parentId, options.kind);
    if (node.isNull()) {
        return node;
    }

    node.setCenter(point);
    node.setRadius(options.radius);
    if (!options.typeId.isEmpty()) {
        node.setTypeId(options.typeId);
    }
    if (!options.layer.isEmpty()) {
        node.setLayer(options.layer);
    }

    emit nodeInserted(node.id());
    declareUnsavedChanges();
    return node;
}

void Mapper::translateNode(const NodeRef& node, const Vector3& offset) {
    QVector<EntityId> moved;
    for (const NodeRef& current : node.getSelfAndAllDescendants().toVector()) {
        current.setCenter(current.getCenter() + offset);
        if (current.hasProperty(NodeProperty::effectiveCenter())) {
            current.setEffectiveCenter(current.getEffectiveCenter() + offset);
        }
        moved.push_back(current.id());
    }

    emit nodesTranslated(moved);
    declareUnsavedChanges();
}

QVector<NodeRef> Mapper::removeNodes(const QVector<NodeRef>& nodes) {
    QVector<NodeRef> affected;
    QSet<EntityId> seen;
    for (const NodeRef& node : nodes) {
        if (!node.valid()) {
            continue;
        }
        for (const NodeRef& current : node.getSelfAndAllDescendants()) {
            if (!seen.contains(current.id())) {
                seen.insert(current.id());
                affected.push_back(current);
            }
        }
    }
    if (affected.isEmpty()) {
        return affected;
    }

    QVector<EntityId> ids;
    for (const NodeRef& node : affected) {
        ids.push_back(node.id());
    }
    emit nodesRemoved(ids);

    for (const NodeRef& node : affected) {
        node.remove();
    }
    declareUnsavedChanges();
    return affected;
}

void Mapper::unremoveNodes(const QVector<NodeRef>& nodes) {
    for (const NodeRef& node : nodes) {
        if (node.unremove()) {
            emit nodeInserted(node.id());
        }
    }
    if (!nodes.isEmpty()) {
        declareUnsavedChanges();
    }
}

QVector<EdgeRef> Mapper::removeEdges(const QVector<EdgeRef>& edges) {
    QVector<EdgeRef> removed;
    for (const EdgeRef& edge : edges) {
        if (edge.valid() && edge.remove()) {
            removed.push_back(edge);
        }
    }
    if (!removed.isEmpty()) {
        emit updated();
        declareUnsavedChanges();
    }
    return removed;
}

QVector<EdgeRef> Mapper::unremoveEdges(const QVector<EdgeRef>& edges) {
    QVector<EdgeRef> restored;
    for (const EdgeRef& edge : edges) {
        if (edge.unremove()) {
            restored.push_back(edge);
        }
    }
    if (!restored.isEmpty()) {
        emit updated();
        declareUnsavedChanges();
    }
    return restored;
}

void Mapper::notifyNodeUpdated(const NodeRef& node) {
    emit nodeUpdated(node.id());
    declareUnsavedChanges();
}

QVector<EdgeRef> Mapper::connectNodeToNearbyNodes(const NodeRef& node) {
    QVector<EdgeRef> created;
    for (const NodeRef& other : m_backend->getNearbyNodes(node, m_settings.blendDistance)) {
        if (!m_backend->getEdgeBetween(node.id(), other.id()).isNull()) {
            continue;
        }
        const EdgeRef edge = m_backend->createEdge(node.id(), other.id());
        if (!edge.isNull()) {
            created.push_back(edge);
        }
    }
    if (!created.isEmpty()) {
        emit updated();
        declareUnsavedChanges();
    }
    return created;
}

QVector<EdgeRef> Mapper::cleanNodeConnectionsAround(const NodeRef& node) {
    QVector<EdgeRef> removed;
    QSet<EntityId> removedIds;

    for (const DirEdgeRef& edge : node.getEdges()) {
        if (removedIds.contains(edge.id())) {
            continue;
        }
        bool lineOk = false;
        const double length = edge.getLine(&lineOk).distanceSquared();
        if (!lineOk) {
            continue;
        }

        for (const DirEdgeRef& crossing : m_backend->getIntersectingEdges(edge, m_settings.blendDistance)) {
            if (removedIds.contains(crossing.id())) {
                continue;
            }
            bool crossingOk = false;
            const double crossingLength = crossing.getLine(&crossingOk).distanceSquared();
            if (!crossingOk) {
                continue;
            }

            if (length < crossingLength) {
                if (crossing.remove()) {
                    removedIds.insert(crossing.id());
                    removed.push_back(crossing);
                }
            } else {
                if (edge.remove()) {
                    removedIds.insert(edge.id());
                    removed.push_back(edge);
                }
                break;
            }
        }
    }

    if (!removed.isEmpty()) {
        qCDebug(lcApp) << "Removed" << removed.size() << "crossing edges around node" << node.id();
        emit updated();
        declareUnsavedChanges();
    }
    return removed;
}

std::unique_ptr<Action> Mapper::performAction(Action& action, QString* errorMessage) {
    QString error;
    std::unique_ptr<Action> inverse = action.perform(&error);
    if (inverse) {
        emit updated();
        return inverse;
    }

    if (m_settings.rollbackFailedActions) {
        if (std::unique_ptr<Action> partial = action.takePartialInverse()) {
            QString rollbackError;
            if (partial->perform(&rollbackError)) {
                qCInfo(lcApp) << "Rolled back the completed part of" << action.label();
            } else {
                qCCritical(lcApp).noquote() << "Rollback of" << action.label() << "failed:" << rollbackError;
            }
            emit updated();
        }
    }
    if (errorMessage) {
        *errorMessage = error;
    }
    return nullptr;
}

bool Mapper::performActionWithUndo(Action& action, QString* errorMessage) {
    std::unique_ptr<Action> inverse = performAction(action, errorMessage);
    if (!inverse) {
        return false;
    }
    if (m_undoStack && !inverse->empty()) {
        m_undoStack->push(new ActionCommand(this, std::move(inverse), action.label(), true));
    }
    return true;
}

void Mapper::setUndoStack(QUndoStack* undoStack) {
    m_undoStack = undoStack;
    if (m_undoStack) {
        m_undoStack->setUndoLimit(m_settings.undoLimit);
    }
}

void Mapper::clearUnsavedChangeState() {
    m_unsavedChanges = false;
    emit unsavedStateChanged(false);
}

void Mapper::declareUnsavedChanges() {
    if (m_unsavedChanges) {
        return;
    }
    m_unsavedChanges = true;
    emit unsavedStateChanged(true);
}

double Mapper::unitsToMeters(double units) const {
    return units / m_settings.unitsPerMeter;
}

double Mapper::metersToUnits(double meters) const {
    return meters * m_settings.unitsPerMeter;
}
