#pragma once

#include "actions/Action.h"
#include "geometry/Geometry.h"
#include "model/EntityRef.h"

#include <QString>
#include <QVector>

#include <optional>

struct ChangeNameOptions {
    NodeRef node;
    QString name;
};

class ChangeNameAction : public Action {
public:
    ChangeNameAction(Mapper* mapper, const ChangeNameOptions& options);

    QString label() const override { return QStringLiteral("Rename Node"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    ChangeNameOptions m_options;
};

struct NodeGeometryOptions {
    NodeRef node;
    Vector3 center;
    // Unset clears the property, so the effective center follows the center again.
    std::optional<Vector3> effectiveCenter;
    double radius = 0.0;
};

class SetNodeGeometryAction : public Action {
public:
    SetNodeGeometryAction(Mapper* mapper, const NodeGeometryOptions& options);

    bool empty() const override { return m_options.node.isNull(); }
    QString label() const override { return QStringLiteral("Set Node Geometry"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    NodeGeometryOptions m_options;
};

struct NodeSetOptions {
    QVector<NodeRef> nodes;
};

// Removes the nodes and all of their descendants.
class RemoveAction : public Action {
public:
    RemoveAction(Mapper* mapper, const NodeSetOptions& options);

    bool empty() const override { return m_options.nodes.isEmpty(); }
    QString label() const override { return QStringLiteral("Remove Nodes"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    NodeSetOptions m_options;
};

class UnremoveAction : public Action {
public:
    UnremoveAction(Mapper* mapper, const NodeSetOptions& options);

    bool empty() const override { return m_options.nodes.isEmpty(); }
    QString label() const override { return QStringLiteral("Restore Nodes"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    NodeSetOptions m_options;
};

struct TranslateOptions {
    NodeRef node;
    Vector3 offset;
};

class TranslateAction : public Action {
public:
    TranslateAction(Mapper* mapper, const TranslateOptions& options);

    QString label() const override { return QStringLiteral("Move Node"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    TranslateOptions m_options;
};

struct EdgeSetOptions {
    QVector<EdgeRef> edges;
};

class RemoveEdgesAction : public Action {
public:
    RemoveEdgesAction(Mapper* mapper, const EdgeSetOptions& options);

    bool empty() const override { return m_options.edges.isEmpty(); }
    QString label() const override { return QStringLiteral("Remove Edges"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    EdgeSetOptions m_options;
};

class UnremoveEdgesAction : public Action {
public:
    UnremoveEdgesAction(Mapper* mapper, const EdgeSetOptions& options);

    bool empty() const override { return m_options.edges.isEmpty(); }
    QString label() const override { return QStringLiteral("Restore Edges"); }

protected:
    std::unique_ptr<Action> execute(QString* errorMessage) override;

private:
    EdgeSetOptions m_options;
};
