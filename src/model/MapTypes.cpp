#include "MapTypes.h"

QString entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Node:
            return QStringLiteral("node");
        case EntityKind::Edge:
            return QStringLiteral("edge");
        case EntityKind::Global:
            return QStringLiteral("global");
    }
    return QStringLiteral("unknown");
}

QString nodeKindName(NodeKind kind) {
    return kind == NodeKind::Object ? QStringLiteral("object") : QStringLiteral("point");
}

bool nodeKindFromName(const QString& name, NodeKind* out) {
    if (!out) {
        return false;
    }
    const QString normalized = name.trimmed().toLower();
    if (normalized == QStringLiteral("object")) {
        *out = NodeKind::Object;
        return true;
    }
    if (normalized == QStringLiteral("point")) {
        *out = NodeKind::Point;
        return true;
    }
    return false;
}
