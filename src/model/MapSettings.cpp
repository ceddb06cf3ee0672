#include "MapSettings.h"

#include "app/LogCategories.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>

bool MapSettingsSerializer::saveToFile(const MapSettings& settings, const QString& filePath, QString* errorMessage) {
    QJsonObject root;
    root[QStringLiteral("schemaVersion")] = settings.schemaVersion;
    root[QStringLiteral("blendDistance")] = settings.blendDistance;
    root[QStringLiteral("unitsPerMeter")] = settings.unitsPerMeter;
    root[QStringLiteral("rollbackFailedActions")] = settings.rollbackFailedActions;
    root[QStringLiteral("undoLimit")] = settings.undoLimit;

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot open file for write: %1").arg(file.errorString());
        }
        return false;
    }

    const QByteArray payload = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Write failed: %1").arg(file.errorString());
        }
        return false;
    }
    return true;
}

bool MapSettingsSerializer::loadFromFile(MapSettings* settings, const QString& filePath, QString* errorMessage) {
    if (!settings) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Settings pointer is null");
        }
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot open file for read: %1").arg(file.errorString());
        }
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument json = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !json.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid JSON: %1").arg(parseError.errorString());
        }
        return false;
    }

    const QJsonObject root = json.object();
    const int schemaVersion = root.value(QStringLiteral("schemaVersion")).toInt(1);
    if (schemaVersion != 1) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unsupported schemaVersion: %1").arg(schemaVersion);
        }
        return false;
    }

    MapSettings loaded = *settings;
    loaded.schemaVersion = schemaVersion;
    loaded.blendDistance = root.value(QStringLiteral("blendDistance")).toDouble(loaded.blendDistance);
    if (loaded.blendDistance <= 0.0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("blendDistance must be positive, got %1").arg(loaded.blendDistance);
        }
        return false;
    }
    loaded.unitsPerMeter = root.value(QStringLiteral("unitsPerMeter")).toDouble(loaded.unitsPerMeter);
    if (loaded.unitsPerMeter <= 0.0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("unitsPerMeter must be positive, got %1").arg(loaded.unitsPerMeter);
        }
        return false;
    }
    loaded.rollbackFailedActions =
        root.value(QStringLiteral("rollbackFailedActions")).toBool(loaded.rollbackFailedActions);
    loaded.undoLimit = std::max(0, root.value(QStringLiteral("undoLimit")).toInt(loaded.undoLimit));

    *settings = loaded;
    qCInfo(lcApp) << "Loaded map settings from" << filePath;
    return true;
}
