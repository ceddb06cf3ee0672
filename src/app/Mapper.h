#pragma once

#include "geometry/Geometry.h"
#include "model/EntityRef.h"
#include "model/MapSettings.h"
#include "model/MapTypes.h"

#include <QObject>
#include <QPointer>
#include <QString>
#include <QVector>

#include <memory>

class Action;
class MapBackend;
class QUndoStack;

struct NodeInsertOptions {
    NodeKind kind = NodeKind::Object;
    QString typeId;
    double radius = 0.0;
    // Null for a root node.
    NodeRef parent;
    QString layer;
};

/**
 * Application-level entry point to a map.
 *
 * Wraps a backend (not owned) with the editing operations the actions are built from, reports
 * every change through signals and keeps track of unsaved changes.
 */
class Mapper : public QObject {
    Q_OBJECT

public:
    explicit Mapper(MapBackend* backend, const MapSettings& settings = MapSettings(), QObject* parent = nullptr);
    ~Mapper() override;

    MapBackend* backend() const { return m_backend; }
    const MapSettings& settings() const { return m_settings; }
    void setSettings(const MapSettings& settings);

    NodeRef insertNode(const Vector3& point, const NodeInsertOptions& options);
    // Moves the node together with all of its descendants.
    void translateNode(const NodeRef& node, const Vector3& offset);
    // Removes each valid node with its valid descendants. Returns everything removed.
    QVector<NodeRef> removeNodes(const QVector<NodeRef>& nodes);
    void unremoveNodes(const QVector<NodeRef>& nodes);
    QVector<EdgeRef> removeEdges(const QVector<EdgeRef>& edges);
    QVector<EdgeRef> unremoveEdges(const QVector<EdgeRef>& edges);
    void notifyNodeUpdated(const NodeRef& node);

    // Returns the created edges.
    QVector<EdgeRef> connectNodeToNearbyNodes(const NodeRef& node);
    // Where two edges cross, the longer one goes. Returns the removed edges.
    QVector<EdgeRef> cleanNodeConnectionsAround(const NodeRef& node);

    // Performs without recording; returns the inverse or null on failure.
    std::unique_ptr<Action> performAction(Action& action, QString* errorMessage = nullptr);
    // Performs and pushes the inverse on the undo stack, if one is attached.
    bool performActionWithUndo(Action& action, QString* errorMessage = nullptr);
    void setUndoStack(QUndoStack* undoStack);
    QUndoStack* undoStack() const { return m_undoStack; }

    bool hasUnsavedChanges() const { return m_unsavedChanges; }
    void clearUnsavedChangeState();

    double unitsToMeters(double units) const;
    double metersToUnits(double meters) const;

signals:
    void nodeInserted(EntityId nodeId);
    void nodeUpdated(EntityId nodeId);
    void nodesRemoved(const QVector<EntityId>& nodeIds);
    void nodesTranslated(const QVector<EntityId>& nodeIds);
    void updated();
    void unsavedStateChanged(bool unsaved);

private:
    void declareUnsavedChanges();

    MapBackend* m_backend = nullptr;
    MapSettings m_settings;
    QPointer<QUndoStack> m_undoStack;
    bool m_unsavedChanges = false;
};
