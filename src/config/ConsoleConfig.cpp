#include "ConsoleConfig.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>
#include <QDebug>

QString ConsoleConfig::resolvedDataDir() const
{
    if (!dataDir.isEmpty()) return dataDir;
    const QString base = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return base + QLatin1Char('/') + QStringLiteral(CONSOLE_APP_NAME);
}

QString ConsoleConfig::filePath(const char* name) const
{
    return QDir(resolvedDataDir()).filePath(QString::fromLatin1(name));
}

bool ConsoleConfig::load(QString& errorString)
{
    QFile f(filePath(CONSOLE_SETTINGS_FILE));
    if (!f.exists()) return true;
    if (!f.open(QIODevice::ReadOnly)) {
        errorString = QStringLiteral("cannot open %1: %2").arg(f.fileName(), f.errorString());
        return false;
    }

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        errorString = QStringLiteral("%1: invalid JSON (%2)").arg(f.fileName(), perr.errorString());
        return false;
    }

    const QJsonObject o = doc.object();
    requestTimeoutMs     = o.value("request_timeout_ms").toInt(requestTimeoutMs);
    refreshIntervalMs    = o.value("refresh_interval_ms").toInt(refreshIntervalMs);
    discoveryIntervalMs  = o.value("discovery_interval_ms").toInt(discoveryIntervalMs);
    discoveryWindowMs    = o.value("discovery_window_ms").toInt(discoveryWindowMs);
    debounceMs           = o.value("debounce_ms").toInt(debounceMs);
    offlineAfterFailures = qMax(1, o.value("offline_after_failures").toInt(offlineAfterFailures));
    discoveryPort        = static_cast<quint16>(o.value("discovery_port").toInt(discoveryPort));
    logRules             = o.value("log_rules").toString(logRules);

    const QJsonObject a = o.value("alerts").toObject();
    const QJsonObject t = a.value("temperature").toObject();
    alerts.temperatureEnabled = t.value("enabled").toBool(alerts.temperatureEnabled);
    alerts.temperatureC       = t.value("threshold_c").toDouble(alerts.temperatureC);
    const QJsonObject c = a.value("cpu").toObject();
    alerts.cpuEnabled   = c.value("enabled").toBool(alerts.cpuEnabled);
    alerts.cpuPercent   = c.value("threshold_percent").toDouble(alerts.cpuPercent);
    return true;
}

bool ConsoleConfig::save(QString& errorString) const
{
    QJsonObject o;
    o["request_timeout_ms"]     = requestTimeoutMs;
    o["refresh_interval_ms"]    = refreshIntervalMs;
    o["discovery_interval_ms"]  = discoveryIntervalMs;
    o["discovery_window_ms"]    = discoveryWindowMs;
    o["debounce_ms"]            = debounceMs;
    o["offline_after_failures"] = offlineAfterFailures;
    o["discovery_port"]         = discoveryPort;
    if (!logRules.isEmpty()) o["log_rules"] = logRules;
    o["alerts"] = QJsonObject{
        {"temperature", QJsonObject{{"enabled", alerts.temperatureEnabled},
                                    {"threshold_c", alerts.temperatureC}}},
        {"cpu", QJsonObject{{"enabled", alerts.cpuEnabled},
                            {"threshold_percent", alerts.cpuPercent}}}
    };

    QDir().mkpath(resolvedDataDir());
    QSaveFile sf(filePath(CONSOLE_SETTINGS_FILE));
    if (!sf.open(QIODevice::WriteOnly)) {
        errorString = sf.errorString();
        return false;
    }
    sf.write(QJsonDocument(o).toJson(QJsonDocument::Indented));
    if (!sf.commit()) {
        errorString = sf.errorString();
        return false;
    }
    return true;
}
