#pragma once
#include <QString>
#include <QStringList>

#include "include/common_path.hpp"

class QCoreApplication;

struct DeviceConfig {
    QString alias = QStringLiteral("camera");
    quint16 port = DEFAULT_CONTROL_PORT;
    QString bearerToken;
    bool authEnabled = false;

    int rateLimitIntervalMs = 50;
    int telemetryIntervalMs = 1000;

    bool advertise = true;
    quint16 discoveryPort = DEFAULT_DISCOVERY_PORT;
    int advertiseIntervalMs = 2000;

    QString logDbPath = QStringLiteral(DEVICE_LOG_DB_PATH DEVICE_LOG_DB);
    QString statePath = QStringLiteral(DEVICE_ROOT "state.json");   // alias + video settings
    QString backlightPath;          // empty: first entry under BACKLIGHT_PATH
    QString logRules;

    // Merges keys present in the JSON file; missing file is not an error.
    bool loadFile(const QString& path, QString& errorString);

    // Applies --config first, then the remaining command-line overrides.
    bool parseArguments(const QCoreApplication& app, QString& errorString);
};
