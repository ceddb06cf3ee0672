#include "NodeTypeCatalog.h"

const NodeTypeCatalog& NodeTypeCatalog::instance() {
    static NodeTypeCatalog catalog;
    return catalog;
}

const NodeTypeSpec* NodeTypeCatalog::find(const QString& typeId) const {
    const auto it = m_specs.find(typeId);
    if (it == m_specs.end()) {
        return nullptr;
    }
    return &it.value();
}

const NodeTypeSpec& NodeTypeCatalog::fallback() const {
    return m_fallback;
}

NodeTypeCatalog::NodeTypeCatalog() {
    addSpec(NodeTypeSpec{QStringLiteral("water"), QStringLiteral("Water"), QStringLiteral("darkblue")});
    addSpec(NodeTypeSpec{QStringLiteral("grass"), QStringLiteral("Grass"), QStringLiteral("lightgreen")});
    addSpec(NodeTypeSpec{QStringLiteral("forest"), QStringLiteral("Forest"), QStringLiteral("darkgreen")});
    addSpec(NodeTypeSpec{QStringLiteral("rocks"), QStringLiteral("Rocks"), QStringLiteral("gray")});
    addSpec(NodeTypeSpec{QStringLiteral("road"), QStringLiteral("Road"), QStringLiteral("brown")});
    addSpec(NodeTypeSpec{QStringLiteral("buildings"), QStringLiteral("Buildings"), QStringLiteral("yellow")});

    m_fallback = *find(QStringLiteral("grass"));
}

void NodeTypeCatalog::addSpec(const NodeTypeSpec& spec) {
    if (!m_specs.contains(spec.typeId)) {
        m_order.push_back(spec.typeId);
    }
    m_specs.insert(spec.typeId, spec);
}
