#pragma once

#include "actions/Action.h"
#include "model/EntityRef.h"

struct NodeCleanupOptions {
    // The object node whose point descendants are merged.
    NodeRef node;
};

/**
 * Merges point descendants of an object node that overlap too much and fits the object's
 * geometry to what is left.
 *
 * Points are visited in tree order. A point not yet merged is kept; every other point closer to
 * it than a quarter of their summed radii is merged into it, including points an earlier keeper
 * already absorbed. A merged point is removed and its connections are copied to every keeper that
 * absorbed it. The object's center becomes the mean of the
 * kept centers and its radius the distance to the furthest kept center.
 */
class NodeCleanupAction : public Action {
public:
    NodeCleanupAction(Mapper* mapper, const NodeCleanupOptions& options);

    bool empty() const override { return m_options.node.isNull(); }
    QString label() const override { return QStringLiteral("Clean Up Nodes"); }
    std::unique_ptr<Action> takePartialInverse() override;

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    NodeCleanupOptions m_options;
    std::unique_ptr<Action> m_partialInverse;
};
