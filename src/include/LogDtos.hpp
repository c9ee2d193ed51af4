#pragma once
#include <QString>
#include <QDateTime>
#include <QJsonObject>

// 시스템 로그 DTO (system_logs 한 행)
struct SystemLog {
    int id{};
    int level{};        // SysLogLevel 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;

    QJsonObject toJson() const {
        QJsonObject o;
        o["id"]      = id;
        o["level"]   = level;
        o["tag"]     = tag;
        o["message"] = message;
        o["ts"]      = timestamp.toString(Qt::ISODateWithMs);
        if (!extra.isEmpty()) o["extra"] = extra;
        return o;
    }
};
