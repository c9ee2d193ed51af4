#include "DeviceConfig.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>
#include "logger.hpp"

bool DeviceConfig::loadFile(const QString& path, QString& errorString)
{
    QFile f(path);
    if (!f.exists()) {
        LOG_INFO(QStringLiteral("no config file at %1, using defaults").arg(path));
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        errorString = QStringLiteral("cannot open %1: %2").arg(path, f.errorString());
        return false;
    }

    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        errorString = QStringLiteral("%1: invalid JSON (%2)").arg(path, perr.errorString());
        return false;
    }

    const QJsonObject o = doc.object();
    alias               = o.value("alias").toString(alias);
    port                = static_cast<quint16>(o.value("port").toInt(port));
    bearerToken         = o.value("bearer_token").toString(bearerToken);
    authEnabled         = o.value("auth_enabled").toBool(authEnabled);
    rateLimitIntervalMs = o.value("rate_limit_interval_ms").toInt(rateLimitIntervalMs);
    telemetryIntervalMs = o.value("telemetry_interval_ms").toInt(telemetryIntervalMs);
    advertise           = o.value("advertise").toBool(advertise);
    discoveryPort       = static_cast<quint16>(o.value("discovery_port").toInt(discoveryPort));
    advertiseIntervalMs = o.value("advertise_interval_ms").toInt(advertiseIntervalMs);
    logDbPath           = o.value("log_db_path").toString(logDbPath);
    statePath           = o.value("state_path").toString(statePath);
    backlightPath       = o.value("backlight_path").toString(backlightPath);
    logRules            = o.value("log_rules").toString(logRules);

    if (authEnabled && bearerToken.isEmpty()) {
        errorString = QStringLiteral("%1: auth_enabled requires bearer_token").arg(path);
        return false;
    }
    return true;
}

bool DeviceConfig::parseArguments(const QCoreApplication& app, QString& errorString)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("camfleet device control server"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOpt({"c", "config"}, "JSON config file.", "path",
                                       QStringLiteral(DEVICE_CONFIG_FILE));
    const QCommandLineOption aliasOpt({"a", "alias"}, "Device alias.", "name");
    const QCommandLineOption portOpt({"p", "port"}, "HTTP/WebSocket port.", "port");
    const QCommandLineOption tokenOpt("token", "Bearer token; enables authentication.", "token");
    const QCommandLineOption noAdvOpt("no-advertise", "Do not announce on the discovery port.");
    const QCommandLineOption dbOpt("log-db", "SQLite system log path.", "path");
    const QCommandLineOption stateOpt("state", "Persisted alias/video settings file.", "path");
    const QCommandLineOption rulesOpt("log-rules", "QLoggingCategory filter rules (';' separated).", "rules");
    parser.addOptions({configOpt, aliasOpt, portOpt, tokenOpt, noAdvOpt, dbOpt, stateOpt, rulesOpt});

    parser.process(app);

    if (!loadFile(parser.value(configOpt), errorString))
        return false;

    if (parser.isSet(aliasOpt)) alias = parser.value(aliasOpt);
    if (parser.isSet(portOpt)) {
        bool ok = false;
        const int p = parser.value(portOpt).toInt(&ok);
        if (!ok || p <= 0 || p > 65535) {
            errorString = QStringLiteral("invalid --port: %1").arg(parser.value(portOpt));
            return false;
        }
        port = static_cast<quint16>(p);
    }
    if (parser.isSet(tokenOpt)) {
        bearerToken = parser.value(tokenOpt);
        authEnabled = !bearerToken.isEmpty();
    }
    if (parser.isSet(noAdvOpt)) advertise = false;
    if (parser.isSet(dbOpt)) logDbPath = parser.value(dbOpt);
    if (parser.isSet(stateOpt)) statePath = parser.value(stateOpt);
    if (parser.isSet(rulesOpt)) logRules = parser.value(rulesOpt);
    return true;
}
