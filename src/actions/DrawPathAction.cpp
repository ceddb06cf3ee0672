#include "DrawPathAction.h"

#include "actions/NodeActions.h"
#include "actions/NodeCleanupAction.h"
#include "app/LogCategories.h"
#include "app/Mapper.h"

DrawPathAction::DrawPathAction(Mapper* mapper, const DrawPathOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> DrawPathAction::takePartialInverse() {
    return std::move(m_partialInverse);
}

std::unique_ptr<Action> DrawPathAction::execute(QString* errorMessage) {
    if (m_options.radius <= 0.0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Draw radius must be positive, got %1").arg(m_options.radius);
        }
        return nullptr;
    }
    if (!m_options.parent.isNull() && !m_options.parent.valid()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot draw into node %1: it is not valid").arg(m_options.parent.id());
        }
        return nullptr;
    }

    NodeInsertOptions insertOptions;
    insertOptions.kind = NodeKind::Point;
    insertOptions.typeId = m_options.typeId;
    insertOptions.radius = m_options.radius;
    insertOptions.parent = m_options.parent;

    QVector<NodeRef> placed;
    for (const Vector3& vertex : m_options.path.withBisectedLines(m_options.radius).vertices()) {
        const NodeRef node = m_mapper->insertNode(vertex, insertOptions);
        if (node.isNull()) {
            m_partialInverse = std::make_unique<RemoveAction>(m_mapper, NodeSetOptions{placed});
            if (errorMessage) {
                *errorMessage = QStringLiteral("Cannot place a node at %1").arg(vertex.toString());
            }
            return nullptr;
        }
        placed.push_back(node);
    }
    qCDebug(lcActions) << "Placed" << placed.size() << "nodes under" << m_options.parent.id();

    ActionList inverse;
    if (m_options.fullCalculation && !m_options.parent.isNull()) {
        NodeCleanupAction cleanup(m_mapper, NodeCleanupOptions{m_options.parent});
        QString error;
        std::unique_ptr<Action> cleanupInverse = m_mapper->performAction(cleanup, &error);
        if (!cleanupInverse) {
            ActionList partial;
            if (std::unique_ptr<Action> leftover = cleanup.takePartialInverse()) {
                partial.push_back(std::move(leftover));
            }
            partial.push_back(std::make_unique<RemoveAction>(m_mapper, NodeSetOptions{placed}));
            m_partialInverse = std::make_unique<BulkAction>(m_mapper, std::move(partial), label());
            if (errorMessage) {
                *errorMessage = error;
            }
            return nullptr;
        }
        inverse.push_back(std::move(cleanupInverse));
    }
    inverse.push_back(std::make_unique<RemoveAction>(m_mapper, NodeSetOptions{placed}));
    return std::make_unique<BulkAction>(m_mapper, std::move(inverse), label());
}
