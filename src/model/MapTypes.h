#pragma once

#include <QString>
#include <QtGlobal>

using EntityId = qint64;
constexpr EntityId kInvalidEntityId = 0;

enum class EntityKind {
    Node,
    Edge,
    Global
};

enum class NodeKind {
    Object,
    Point
};

QString entityKindName(EntityKind kind);
QString nodeKindName(NodeKind kind);
bool nodeKindFromName(const QString& name, NodeKind* out);

namespace NodeProperty {
inline QString center() { return QStringLiteral("center"); }
inline QString effectiveCenter() { return QStringLiteral("effectiveCenter"); }
inline QString radius() { return QStringLiteral("radius"); }
inline QString type() { return QStringLiteral("type"); }
inline QString layer() { return QStringLiteral("layer"); }
inline QString name() { return QStringLiteral("name"); }
}  // namespace NodeProperty
