#pragma once

#include <QHash>
#include <QString>
#include <QStringList>

struct NodeTypeSpec {
    QString typeId;
    QString displayName;
    // Any name QColor understands.
    QString color;
};

class NodeTypeCatalog {
public:
    static const NodeTypeCatalog& instance();

    const NodeTypeSpec* find(const QString& typeId) const;
    const NodeTypeSpec& fallback() const;
    // Registration order.
    QStringList typeIds() const { return m_order; }

private:
    NodeTypeCatalog();
    void addSpec(const NodeTypeSpec& spec);

    QHash<QString, NodeTypeSpec> m_specs;
    QStringList m_order;
    NodeTypeSpec m_fallback;
};
