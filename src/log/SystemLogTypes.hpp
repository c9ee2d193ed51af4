#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

inline const char* sysLogLevelName(SysLogLevel lv)
{
    switch (lv) {
        case SysLogLevel::Debug:    return "debug";
        case SysLogLevel::Info:     return "info";
        case SysLogLevel::Warn:     return "warn";
        case SysLogLevel::Error:    return "error";
        case SysLogLevel::Critical: return "critical";
    }
    return "info";
}

struct SystemLogEntry {
    SysLogLevel level = SysLogLevel::Info;
    QString tag;        // 예: "HTTP", "WS", "CAMERA", "REGISTRY", "ORCH"
    QString message;
    QDateTime ts;
    QString extra;      // JSON text, optional
};

Q_DECLARE_METATYPE(SystemLogEntry)
