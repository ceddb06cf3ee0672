#pragma once

#include "actions/Action.h"
#include "geometry/Geometry.h"
#include "model/EntityRef.h"

struct DrawPathOptions {
    // In map units.
    Path path;
    double radius = 1.0;
    QString typeId;
    NodeRef parent;
    // Also run node cleanup on the parent.
    bool fullCalculation = true;
};

// Places a point node at every vertex of the path, bisecting segments longer than the radius.
class DrawPathAction : public Action {
public:
    DrawPathAction(Mapper* mapper, const DrawPathOptions& options);

    QString label() const override { return QStringLiteral("Draw Path"); }
    std::unique_ptr<Action> takePartialInverse() override;

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    DrawPathOptions m_options;
    std::unique_ptr<Action> m_partialInverse;
};
