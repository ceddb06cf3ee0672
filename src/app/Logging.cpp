#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QStringList>
#include <QTextStream>

#include <cstdlib>
#include <iostream>

namespace {

QMutex gLogMutex;
QFile gLogFile;
QString gLogFilePath;
QtMessageHandler gPreviousHandler = nullptr;
bool gInitialized = false;
bool gDebugLoggingEnabled = false;

const char* levelToString(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

bool isEnabledFlag(const QString& value) {
    const QString normalized = value.trimmed().toLower();
    return normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
           normalized == QStringLiteral("yes") || normalized == QStringLiteral("on");
}

void setLoggingRules(bool debugBuild) {
    gDebugLoggingEnabled = debugBuild || isEnabledFlag(qEnvironmentVariable("MAPPER_LOG_DEBUG"));

    QStringList rules;
    rules << QStringLiteral("mapper.*.info=true");
    rules << QStringLiteral("mapper.*.warning=true");
    rules << QStringLiteral("mapper.*.critical=true");

    if (gDebugLoggingEnabled) {
        rules << QStringLiteral("mapper.*.debug=true");
    } else {
        rules << QStringLiteral("mapper.*.debug=false");
        const QString configured = qEnvironmentVariable("MAPPER_LOG_DEBUG_CATEGORIES");
        for (const QString& token : configured.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
            const QString category = token.trimmed();
            if (!category.isEmpty()) {
                rules << QStringLiteral("%1.debug=true").arg(category);
            }
        }
    }

    QLoggingCategory::setFilterRules(rules.join(QLatin1Char('\n')));
}

QString formatMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString timestamp = QDateTime::currentDateTime().toString(Qt::ISODateWithMs);
    const QString category = context.category ? QString::fromUtf8(context.category) : QStringLiteral("default");
    return QStringLiteral("%1 [%2] [%3] %4").arg(timestamp, QString::fromLatin1(levelToString(type)), category, msg);
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString formatted = formatMessage(type, context, msg);

    {
        QMutexLocker lock(&gLogMutex);
        if (gLogFile.isOpen()) {
            QTextStream stream(&gLogFile);
            stream << formatted << Qt::endl;
            gLogFile.flush();
        }
    }

    if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
        std::cerr << formatted.toStdString() << std::endl;
    } else {
        std::cout << formatted.toStdString() << std::endl;
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
}

QString makeLogDirectoryPath() {
    const QString overridePath = qEnvironmentVariable("MAPPER_LOG_DIR").trimmed();
    if (!overridePath.isEmpty()) {
        return overridePath;
    }

    const QString appDataPath = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!appDataPath.isEmpty()) {
        return QDir(appDataPath).filePath(QStringLiteral("logs"));
    }
    return QDir::current().filePath(QStringLiteral("logs"));
}

}  // namespace

bool Logging::initialize(const QString& appName, bool debugBuild) {
    QString openedPath;

    {
        QMutexLocker lock(&gLogMutex);
        if (gInitialized) {
            return true;
        }

        setLoggingRules(debugBuild);

        const QString logDirPath = makeLogDirectoryPath();
        QDir dir(logDirPath);
        if (dir.exists() || dir.mkpath(QStringLiteral("."))) {
            const QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz"));
            const QString fileName = QStringLiteral("%1_%2_%3.log")
                                         .arg(appName.toLower(), timestamp)
                                         .arg(QCoreApplication::applicationPid());
            gLogFile.setFileName(dir.filePath(fileName));
            if (gLogFile.open(QIODevice::WriteOnly | QIODevice::Text)) {
                gLogFilePath = gLogFile.fileName();
            } else {
                std::cerr << "Failed to open log file: " << gLogFile.fileName().toStdString() << std::endl;
            }
        } else {
            std::cerr << "Failed to create log directory: " << logDirPath.toStdString() << std::endl;
        }

        // Console logging still works without a file.
        gPreviousHandler = qInstallMessageHandler(messageHandler);
        gInitialized = true;
        openedPath = gLogFilePath;
    }

    qInfo().noquote() << "Logging initialized"
                      << "logFile=" << (openedPath.isEmpty() ? QStringLiteral("<none>") : openedPath)
                      << "debugLogsEnabled=" << gDebugLoggingEnabled;
    return true;
}

void Logging::shutdown() {
    QMutexLocker lock(&gLogMutex);
    if (!gInitialized) {
        return;
    }

    qInstallMessageHandler(gPreviousHandler);
    gPreviousHandler = nullptr;
    if (gLogFile.isOpen()) {
        gLogFile.flush();
        gLogFile.close();
    }
    gLogFilePath.clear();
    gInitialized = false;
}

QString Logging::logFilePath() {
    QMutexLocker lock(&gLogMutex);
    return gLogFilePath;
}

bool Logging::isDebugLoggingEnabled() {
    QMutexLocker lock(&gLogMutex);
    return gDebugLoggingEnabled;
}
