#pragma once

#include <QString>

class Logging {
public:
    // Installs the message handler and opens a per-run log file. Safe to call twice.
    static bool initialize(const QString& appName, bool debugBuild);
    static void shutdown();

    static QString logFilePath();
    static bool isDebugLoggingEnabled();
};
