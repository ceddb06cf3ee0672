#pragma once

#include <QString>

struct MapSettings {
    int schemaVersion = 1;
    // Search radius bounding the neighbour and intersection scans, in map units.
    double blendDistance = 400.0;
    double unitsPerMeter = 0.5;
    // Run the partial inverse of a failed action so the map is left as it was.
    bool rollbackFailedActions = true;
    // 0 keeps every undo step.
    int undoLimit = 0;
};

class MapSettingsSerializer {
public:
    static bool saveToFile(const MapSettings& settings, const QString& filePath, QString* errorMessage = nullptr);
    static bool loadFromFile(MapSettings* settings, const QString& filePath, QString* errorMessage = nullptr);
};
