#include "FleetTypes.hpp"

#include "protocol/ApiError.hpp"
#include "protocol/JsonFields.hpp"

QString livenessName(DeviceLiveness l)
{
    switch (l) {
        case DeviceLiveness::Online:  return QStringLiteral("online");
        case DeviceLiveness::Stale:   return QStringLiteral("stale");
        case DeviceLiveness::Offline: return QStringLiteral("offline");
    }
    return QStringLiteral("offline");
}

QString failureKindName(DeviceFailureKind k)
{
    switch (k) {
        case DeviceFailureKind::None:       return QString();
        case DeviceFailureKind::NotFound:   return QStringLiteral("NOT_FOUND");
        case DeviceFailureKind::Timeout:    return QStringLiteral("TIMEOUT");
        case DeviceFailureKind::Connection: return QStringLiteral("CONNECTION");
        case DeviceFailureKind::Http:       return QStringLiteral("HTTP");
        case DeviceFailureKind::Protocol:   return QStringLiteral("PROTOCOL");
    }
    return QString();
}

QString Device::makeId(const QString& host, quint16 port)
{
    return QStringLiteral("%1:%2").arg(host).arg(port);
}

QJsonObject Device::toJson() const
{
    QJsonObject o{
        {"id",    id},
        {"alias", alias},
        {"host",  host},
        {"port",  int(port)},
        {"token", token},
    };
    if (streamSettings) o.insert("stream_settings", streamSettings->toJson());
    if (cameraSettings) o.insert("camera_settings", cameraSettings->toJson());
    return o;
}

Device Device::fromJson(const QJsonObject& o)
{
    Device d;
    d.host  = JsonFields::requireString(o, "host");
    const qint64 port = JsonFields::requireInt(o, "port");
    if (port <= 0 || port > 65535)
        throw ApiError::invalidRequest(QStringLiteral("port out of range: %1").arg(port));
    d.port  = static_cast<quint16>(port);
    d.id    = JsonFields::optionalString(o, "id").value_or(makeId(d.host, d.port));
    d.alias = JsonFields::optionalString(o, "alias").value_or(QString());
    d.token = JsonFields::optionalString(o, "token").value_or(QString());
    if (const auto s = JsonFields::optionalObject(o, "stream_settings"))
        d.streamSettings = StreamStartRequest::fromJson(*s);
    if (const auto c = JsonFields::optionalObject(o, "camera_settings"))
        d.cameraSettings = CameraSettingsRequest::fromJson(*c);
    // 첫 refresh 전까지 offline
    d.liveness = DeviceLiveness::Offline;
    return d;
}

QJsonObject GroupOperationResult::toJson() const
{
    QJsonObject o{{"device_id", deviceId}, {"success", success}};
    if (!success) o.insert("error", error);
    if (success && !data.isEmpty()) o.insert("data", data);
    return o;
}
