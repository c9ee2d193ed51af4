#pragma once
#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <optional>

#include "protocol/ApiModels.hpp"

enum class DeviceLiveness { Online, Stale, Offline };

QString livenessName(DeviceLiveness l);

// One claimed device. Owned by DeviceRegistry; everything else gets copies.
struct Device {
    QString id;              // "host:port"
    QString alias;
    QString host;
    quint16 port = 0;
    QString token;

    std::optional<StatusResponse> status;       // last successful GET /status
    std::optional<TelemetryFrame> telemetry;    // last frame from the telemetry link
    DeviceLiveness liveness = DeviceLiveness::Offline;
    int consecutiveFailures = 0;

    std::optional<StreamStartRequest> streamSettings;
    std::optional<CameraSettingsRequest> cameraSettings;

    static QString makeId(const QString& host, quint16 port);

    // Persisted subset only (no status / telemetry / liveness).
    QJsonObject toJson() const;
    static Device fromJson(const QJsonObject& o);
};

struct DiscoveredCandidate {
    QString alias;
    QString host;
    quint16 port = 0;
    QString version;
    QString protocol;

    QString id() const { return Device::makeId(host, port); }
};

enum class DeviceFailureKind { None, NotFound, Timeout, Connection, Http, Protocol };

QString failureKindName(DeviceFailureKind k);

struct GroupOperationResult {
    QString deviceId;
    bool success = false;
    QString error;           // "<KIND>: <detail>", empty on success
    QJsonObject data;        // device's JSON reply on success (measurements, levels)

    QJsonObject toJson() const;
};

using GroupResults = QList<GroupOperationResult>;

Q_DECLARE_METATYPE(DiscoveredCandidate)
Q_DECLARE_METATYPE(GroupOperationResult)
