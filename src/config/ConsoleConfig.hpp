#pragma once
#include <QString>

#include "include/common_path.hpp"

struct AlertThresholds {
    bool temperatureEnabled = true;
    double temperatureC = 40.0;
    bool cpuEnabled = false;
    double cpuPercent = 100.0;
};

struct ConsoleConfig {
    QString dataDir;                 // empty: QStandardPaths::AppDataLocation
    int requestTimeoutMs = 5000;
    int refreshIntervalMs = 2000;
    int discoveryIntervalMs = 10000;
    int discoveryWindowMs = 1500;
    int debounceMs = 300;
    int offlineAfterFailures = 3;
    quint16 discoveryPort = DEFAULT_DISCOVERY_PORT;
    AlertThresholds alerts;
    QString logRules;

    QString resolvedDataDir() const;
    QString filePath(const char* name) const;

    // <dataDir>/settings.json; missing file leaves defaults.
    bool load(QString& errorString);
    bool save(QString& errorString) const;
};
