#include "actions/DrawPathAction.h"
#include "actions/NodeCleanupAction.h"
#include "app/LogCategories.h"
#include "app/Logging.h"
#include "app/Mapper.h"
#include "model/MapSettings.h"
#include "model/MemoryMapBackend.h"
#include "model/NodeTypeCatalog.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSet>
#include <QTextStream>
#include <QUndoStack>

namespace {
int countEdges(const NodeRef& object) {
    QSet<EntityId> edges;
    for (const NodeRef& node : object.getAllDescendants()) {
        for (const DirEdgeRef& edge : node.getEdges()) {
            edges.insert(edge.id());
        }
    }
    return edges.size();
}

void printSummary(QTextStream& out, const QString& stage, const NodeRef& object) {
    out << stage << ": " << object.getAllDescendants().toVector().size() << " points, " << countEdges(object)
        << " edges, center " << object.getCenter().toString() << ", radius " << object.getRadius() << Qt::endl;
}
}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("mapper_demo"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Draws a path into an in-memory map and cleans it up."));
    parser.addHelpOption();
    const QCommandLineOption settingsOption(QStringList{QStringLiteral("s"), QStringLiteral("settings")},
                                            QStringLiteral("Load map settings from <file>."),
                                            QStringLiteral("file"));
    const QCommandLineOption debugOption(QStringList{QStringLiteral("d"), QStringLiteral("debug")},
                                         QStringLiteral("Enable debug logging."));
    parser.addOption(settingsOption);
    parser.addOption(debugOption);
    parser.process(app);

    Logging::initialize(QStringLiteral("mapper_demo"), parser.isSet(debugOption));

    MapSettings settings;
    if (parser.isSet(settingsOption)) {
        QString error;
        if (!MapSettingsSerializer::loadFromFile(&settings, parser.value(settingsOption), &error)) {
            qCCritical(lcApp).noquote() << "Cannot load settings:" << error;
            Logging::shutdown();
            return 1;
        }
    }

    MemoryMapBackend backend;
    Mapper mapper(&backend, settings);
    QUndoStack undoStack;
    mapper.setUndoStack(&undoStack);

    const QString typeId = NodeTypeCatalog::instance().typeIds().value(0, NodeTypeCatalog::instance().fallback().typeId);
    NodeInsertOptions objectOptions;
    objectOptions.typeId = typeId;
    const NodeRef object = mapper.insertNode(Vector3(), objectOptions);

    // A closed loop; the last corner overlaps the first.
    Path path(Vector3{0.0, 0.0, 0.0});
    path.next(Vector3{40.0, 0.0, 0.0});
    path.next(Vector3{40.0, 40.0, 0.0});
    path.next(Vector3{0.0, 40.0, 0.0});
    path.next(Vector3{0.0, 1.0, 0.0});

    DrawPathOptions drawOptions;
    drawOptions.path = path;
    drawOptions.radius = 8.0;
    drawOptions.typeId = typeId;
    drawOptions.parent = object;
    drawOptions.fullCalculation = false;

    QTextStream out(stdout);
    QString error;
    DrawPathAction draw(&mapper, drawOptions);
    if (!mapper.performActionWithUndo(draw, &error)) {
        qCCritical(lcApp).noquote() << "Drawing failed:" << error;
        Logging::shutdown();
        return 1;
    }
    for (const NodeRef& point : object.getAllDescendants().toVector()) {
        mapper.connectNodeToNearbyNodes(point);
    }
    printSummary(out, QStringLiteral("drawn"), object);

    NodeCleanupAction cleanup(&mapper, NodeCleanupOptions{object});
    if (!mapper.performActionWithUndo(cleanup, &error)) {
        qCCritical(lcApp).noquote() << "Cleanup failed:" << error;
        Logging::shutdown();
        return 1;
    }
    printSummary(out, QStringLiteral("cleaned"), object);

    undoStack.undo();
    printSummary(out, QStringLiteral("undone"), object);
    undoStack.redo();
    printSummary(out, QStringLiteral("redone"), object);

    out << "object radius " << mapper.unitsToMeters(object.getRadius()) << " m, "
        << (mapper.hasUnsavedChanges() ? "unsaved changes" : "no changes") << Qt::endl;

    Logging::shutdown();
    return 0;
}
