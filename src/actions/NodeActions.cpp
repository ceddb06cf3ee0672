#include "NodeActions.h"

#include "app/Mapper.h"

namespace {
bool requireNode(const NodeRef& node, const QString& what, QString* errorMessage) {
    if (node.exists()) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = QStringLiteral("%1: node %2 does not exist").arg(what).arg(node.id());
    }
    return false;
}
}  // namespace

ChangeNameAction::ChangeNameAction(Mapper* mapper, const ChangeNameOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> ChangeNameAction::execute(QString* errorMessage) {
    const NodeRef& node = m_options.node;
    if (!requireNode(node, label(), errorMessage)) {
        return nullptr;
    }

    const QString oldName = node.getName();
    if (!node.setName(m_options.name)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot rename node %1").arg(node.id());
        }
        return nullptr;
    }
    m_mapper->notifyNodeUpdated(node);
    return std::make_unique<ChangeNameAction>(m_mapper, ChangeNameOptions{node, oldName});
}

SetNodeGeometryAction::SetNodeGeometryAction(Mapper* mapper, const NodeGeometryOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> SetNodeGeometryAction::execute(QString* errorMessage) {
    const NodeRef& node = m_options.node;
    if (!requireNode(node, label(), errorMessage)) {
        return nullptr;
    }

    NodeGeometryOptions previous{node, node.getCenter(), std::nullopt, node.getRadius()};
    if (node.hasProperty(NodeProperty::effectiveCenter())) {
        previous.effectiveCenter = node.getEffectiveCenter();
    }

    const bool effectiveCenterSet = m_options.effectiveCenter ? node.setEffectiveCenter(*m_options.effectiveCenter)
                                                              : node.clearEffectiveCenter();
    if (!node.setCenter(m_options.center) || !effectiveCenterSet || !node.setRadius(m_options.radius)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot update geometry of node %1").arg(node.id());
        }
        return nullptr;
    }
    m_mapper->notifyNodeUpdated(node);
    return std::make_unique<SetNodeGeometryAction>(m_mapper, previous);
}

RemoveAction::RemoveAction(Mapper* mapper, const NodeSetOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> RemoveAction::execute(QString*) {
    const QVector<NodeRef> affected = m_mapper->removeNodes(m_options.nodes);
    return std::make_unique<UnremoveAction>(m_mapper, NodeSetOptions{affected});
}

UnremoveAction::UnremoveAction(Mapper* mapper, const NodeSetOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> UnremoveAction::execute(QString*) {
    m_mapper->unremoveNodes(m_options.nodes);
    return std::make_unique<RemoveAction>(m_mapper, m_options);
}

TranslateAction::TranslateAction(Mapper* mapper, const TranslateOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> TranslateAction::execute(QString* errorMessage) {
    if (!requireNode(m_options.node, label(), errorMessage)) {
        return nullptr;
    }
    m_mapper->translateNode(m_options.node, m_options.offset);
    return std::make_unique<TranslateAction>(m_mapper, TranslateOptions{m_options.node, m_options.offset * -1.0});
}

RemoveEdgesAction::RemoveEdgesAction(Mapper* mapper, const EdgeSetOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> RemoveEdgesAction::execute(QString*) {
    const QVector<EdgeRef> removed = m_mapper->removeEdges(m_options.edges);
    return std::make_unique<UnremoveEdgesAction>(m_mapper, EdgeSetOptions{removed});
}

UnremoveEdgesAction::UnremoveEdgesAction(Mapper* mapper, const EdgeSetOptions& options)
    : Action(mapper),
      m_options(options) {}

std::unique_ptr<Action> UnremoveEdgesAction::execute(QString*) {
    const QVector<EdgeRef> restored = m_mapper->unremoveEdges(m_options.edges);
    return std::make_unique<RemoveEdgesAction>(m_mapper, EdgeSetOptions{restored});
}
