#include "NodeCleanupAction.h"

#include "actions/NodeActions.h"
#include "app/LogCategories.h"
#include "app/Mapper.h"
#include "model/MapBackend.h"

#include <QPair>
#include <QSet>
#include <QVector>

namespace {
struct Vertex {
    NodeRef node;
    double radius = 0.0;
    Vector3 center;
};
}  // namespace

NodeCleanupAction::NodeCleanupAction(Mapper* mapper, const NodeCleanupOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> NodeCleanupAction::takePartialInverse() {
    return std::move(m_partialInverse);
}

std::unique_ptr<Action> NodeCleanupAction::execute(QString* errorMessage) {
    const NodeRef& object = m_options.node;
    if (!object.valid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot clean up node %1: it is not valid").arg(object.id());
        }
        return nullptr;
    }
    MapBackend* backend = m_mapper->backend();

    QVector<Vertex> vertices;
    for (const NodeRef& descendant : object.getAllDescendants()) {
        if (descendant.kind() == NodeKind::Point) {
            vertices.push_back(Vertex{descendant, descendant.getRadius(), descendant.getCenter()});
        }
    }

    QSet<EntityId> removedIds;
    QVector<NodeRef> removedNodes;
    // (keeper, merged point)
    QVector<QPair<NodeRef, NodeRef>> merges;
    QVector<Vector3> keptCenters;
    Vector3 sum;

    for (int i = 0; i < vertices.size(); ++i) {
        const Vertex& keeper = vertices[i];
        if (removedIds.contains(keeper.node.id())) {
            continue;
        }
        sum += keeper.center;
        keptCenters.push_back(keeper.center);

        // Marked points stay candidates for later keepers.
        for (int j = 0; j < vertices.size(); ++j) {
            if (j == i) {
                continue;
            }
            const Vertex& other = vertices[j];
            if ((other.center - keeper.center).length() < (keeper.radius + other.radius) / 4.0) {
                if (!removedIds.contains(other.node.id())) {
                    removedIds.insert(other.node.id());
                    removedNodes.push_back(other.node);
                }
                merges.push_back(qMakePair(keeper.node, other.node));
            }
        }
    }

    const Vector3 center = keptCenters.isEmpty() ? Vector3() : sum / static_cast<double>(keptCenters.size());
    double radius = 0.0;
    for (const Vector3& kept : keptCenters) {
        const double distance = (kept - center).length();
        if (distance >= radius) {
            radius = distance;
        }
    }

    QVector<EdgeRef> createdEdges;
    for (const QPair<NodeRef, NodeRef>& merge : merges) {
        const NodeRef& keeper = merge.first;
        for (const NodeRef& neighbor : merge.second.getNeighbors()) {
            if (neighbor.id() == keeper.id() || !backend->getEdgeBetween(keeper.id(), neighbor.id()).isNull()) {
                continue;
            }
            const EdgeRef edge = backend->createEdge(keeper.id(), neighbor.id());
            if (!edge.isNull()) {
                createdEdges.push_back(edge);
            }
        }
    }

    qCDebug(lcCleanup) << "Node" << object.id() << ":" << vertices.size() << "points," << removedNodes.size()
                       << "merged," << createdEdges.size() << "edges moved";

    ActionList steps;
    steps.push_back(std::make_unique<RemoveAction>(m_mapper, NodeSetOptions{removedNodes}));
    steps.push_back(std::make_unique<SetNodeGeometryAction>(m_mapper, NodeGeometryOptions{object, center, center, radius}));
    BulkAction apply(m_mapper, std::move(steps), label());

    QString error;
    std::unique_ptr<Action> applyInverse = m_mapper->performAction(apply, &error);
    if (!applyInverse) {
        ActionList partial;
        if (std::unique_ptr<Action> leftover = apply.takePartialInverse()) {
            partial.push_back(std::move(leftover));
        }
        partial.push_back(std::make_unique<RemoveEdgesAction>(m_mapper, EdgeSetOptions{createdEdges}));
        m_partialInverse = std::make_unique<BulkAction>(m_mapper, std::move(partial), label());
        if (errorMessage) {
            *errorMessage = error;
        }
        return nullptr;
    }

    ActionList inverse;
    inverse.push_back(std::move(applyInverse));
    inverse.push_back(std::make_unique<RemoveEdgesAction>(m_mapper, EdgeSetOptions{createdEdges}));
    return std::make_unique<BulkAction>(m_mapper, std::move(inverse), label());
}
